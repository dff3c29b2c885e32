#include "core/errors.hpp"

#include <array>

namespace fishbowl {

static constexpr std::array<std::string_view, 6> ERROR_KIND_NAMES = {
        "validation", "state_conflict", "not_found", "forbidden", "no_eligible_player", "integrity",
};

std::string_view toString(ErrorKind kind) {
	return ERROR_KIND_NAMES[static_cast<std::size_t>(kind)];
}

GameError::GameError(Error error) : std::runtime_error(error.message), m_error(std::move(error)) {
}

const Error& GameError::error() const {
	return m_error;
}

Error validationError(std::string message, std::vector<std::string> details) {
	return Error{.kind = ErrorKind::Validation, .message = std::move(message), .details = std::move(details)};
}

Error notFoundError(std::string message) {
	return Error{.kind = ErrorKind::NotFound, .message = std::move(message)};
}

Error stateConflictError(std::string message, GameStatus status, SubStatus subStatus) {
	return Error{
	        .kind             = ErrorKind::StateConflict,
	        .message          = std::move(message),
	        .currentStatus    = status,
	        .currentSubStatus = subStatus,
	};
}

Error forbiddenError(std::string message, PlayerId expectedPlayer) {
	return Error{.kind = ErrorKind::Forbidden, .message = std::move(message), .expectedPlayerId = std::move(expectedPlayer)};
}

Error noEligiblePlayerError(std::string message) {
	return Error{.kind = ErrorKind::NoEligiblePlayer, .message = std::move(message)};
}

Error integrityError(std::string message) {
	return Error{.kind = ErrorKind::Integrity, .message = std::move(message)};
}

} // namespace fishbowl
