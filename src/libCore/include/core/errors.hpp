#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace fishbowl {

enum class ErrorKind {
	Validation,       //!< Caller supplied data or roster preconditions invalid.
	StateConflict,    //!< Operation not allowed in the current status/sub status.
	NotFound,         //!< Unknown game, player, team, phrase or turn.
	Forbidden,        //!< Caller is not the acting player.
	NoEligiblePlayer, //!< Nobody connected to hand the turn to.
	Integrity         //!< Corrupted ring or store failure. Indicates a bug.
};

std::string_view toString(ErrorKind kind);

//! Structured rejection returned to callers.
//! Carries enough context for a client to decide between retry, refresh and giving up.
struct Error {
	ErrorKind kind;
	std::string message;

	std::optional<GameStatus> currentStatus;   //!< Set for state conflicts.
	std::optional<SubStatus> currentSubStatus; //!< Set for state conflicts.
	std::optional<PlayerId> expectedPlayerId;  //!< Set when the wrong player acted.
	std::vector<std::string> details{};        //!< Individual validation failures.
};

//! Thrown inside a transaction to abort the whole operation.
class GameError : public std::runtime_error {
public:
	explicit GameError(Error error);

	const Error& error() const;

private:
	Error m_error;
};

//! Raised by entity stores on constraint violations (duplicate insert, update of unknown row).
class StoreError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Either the operation result or the reason it was rejected.
template <class T>
using Outcome = std::variant<T, Error>;

template <class T>
bool succeeded(const Outcome<T>& outcome) {
	return std::holds_alternative<T>(outcome);
}

// Factories for the common rejections.
Error validationError(std::string message, std::vector<std::string> details = {});
Error notFoundError(std::string message);
Error stateConflictError(std::string message, GameStatus status, SubStatus subStatus);
Error forbiddenError(std::string message, PlayerId expectedPlayer);
Error noEligiblePlayerError(std::string message);
Error integrityError(std::string message);

} // namespace fishbowl
