#include "core/gameLobby.hpp"

#include "Logging.hpp"
#include "transactionRunner.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace fishbowl {

static constexpr std::string_view COMPONENT = "GameLobby";

static std::string lowercase(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

GameLobby::GameLobby(IEntityStore& store, Random& random, NowFunction now) : m_store(store), m_random(random), m_now(std::move(now)) {
}

Outcome<CreateGameResult> GameLobby::createGame(const CreateGameRequest& request) {
	const auto gameName = trim(request.name);
	const auto hostName = trim(request.hostName);

	std::vector<std::string> errors = validateConfig({
	        .teamCount        = request.config.teamCount,
	        .phrasesPerPlayer = request.config.phrasesPerPlayer,
	        .timerDuration    = request.config.timerDuration,
	});
	if (auto problem = validateGameName(gameName)) {
		errors.push_back(*problem);
	}
	if (auto problem = validatePlayerName(hostName)) {
		errors.push_back(*problem);
	}
	if (!errors.empty()) {
		return validationError("Invalid game settings", std::move(errors));
	}

	for (unsigned attempt = 0u; attempt < GAME_CODE_ATTEMPTS; ++attempt) {
		const auto code = m_random.code(GAME_CODE_LENGTH);
		if (m_store.contains(code)) {
			continue;
		}

		auto outcome = runTransaction<std::optional<CreateGameResult>>(m_store, code, COMPONENT, [&](ITransaction& tx) -> std::optional<CreateGameResult> {
			if (tx.game()) {
				return std::nullopt; // Taken by a concurrent create.
			}

			const auto now = m_now();
			CreateGameResult result{
			        .game = Game{
			                .id               = code,
			                .name             = gameName,
			                .hostPlayerId     = m_random.uuid(),
			                .teamCount        = request.config.teamCount,
			                .phrasesPerPlayer = request.config.phrasesPerPlayer,
			                .timerDuration    = request.config.timerDuration,
			                .createdAt        = now,
			        },
			};
			tx.insert(result.game);

			for (std::size_t i = 0u; i < request.config.teamCount; ++i) {
				result.teams.push_back(makeTeam(code, i));
				tx.insert(result.teams.back());
			}

			result.host = Player{
			        .id         = result.game.hostPlayerId,
			        .gameId     = code,
			        .teamId     = result.teams.front().id,
			        .name       = hostName,
			        .lastSeenAt = now,
			};
			tx.insert(result.host);
			return result;
		});

		if (auto* error = std::get_if<Error>(&outcome)) {
			return *error;
		}
		if (auto& created = std::get<std::optional<CreateGameResult>>(outcome)) {
			Logger().Log(Logging::LogLevel::Info, std::format("[{}] Created game '{}' ({}) with {} teams.", COMPONENT, code, gameName, created->teams.size()));
			return std::move(*created);
		}
	}

	Logger().Log(Logging::LogLevel::Error, std::format("[{}] No free game code after {} attempts.", COMPONENT, GAME_CODE_ATTEMPTS));
	return integrityError("Could not generate a unique game code");
}

Outcome<JoinGameResult> GameLobby::joinGame(const GameId& gameId, const std::string& playerName) {
	const auto name = trim(playerName);
	if (auto problem = validatePlayerName(name)) {
		return validationError(*problem);
	}

	return runTransaction<JoinGameResult>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requireSetup(tx);

		auto players = tx.players();
		const auto taken = std::any_of(players.begin(), players.end(), [&](const Player& p) { return p.name == name; });
		if (taken) {
			throw GameError(validationError(std::format("Player name '{}' is already taken in this game", name)));
		}

		std::unordered_map<TeamId, std::size_t> teamSizes;
		for (const auto& player: players) {
			if (player.teamId) {
				++teamSizes[*player.teamId];
			}
		}
		const auto teams = tx.teams();
		const auto smallest =
		        std::min_element(teams.begin(), teams.end(), [&](const Team& lhs, const Team& rhs) { return teamSizes[lhs.id] < teamSizes[rhs.id]; });

		Player player{
		        .id         = m_random.uuid(),
		        .gameId     = gameId,
		        .teamId     = smallest != teams.end() ? std::optional<TeamId>(smallest->id) : std::nullopt,
		        .name       = name,
		        .lastSeenAt = m_now(),
		};
		tx.insert(player);
		refreshReadiness(tx, game);

		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Player '{}' joined game '{}'.", COMPONENT, name, gameId));
		return JoinGameResult{.player = player, .playerCount = players.size() + 1u};
	});
}

Outcome<Player> GameLobby::assignTeam(const GameId& gameId, const PlayerId& playerId, const TeamId& teamId) {
	return runTransaction<Player>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game   = requireSetup(tx);
		auto player = requirePlayer(tx, playerId);
		if (!tx.team(teamId)) {
			throw GameError(notFoundError(std::format("Team '{}' not found", teamId)));
		}

		player.teamId = teamId;
		tx.update(player);
		refreshReadiness(tx, game);
		return player;
	});
}

Outcome<Game> GameLobby::updateConfig(const GameId& gameId, const ConfigUpdate& update) {
	if (auto errors = validateConfig(update); !errors.empty()) {
		return validationError("Invalid game settings", std::move(errors));
	}

	return runTransaction<Game>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requireSetup(tx);

		if (update.teamCount) {
			if (*update.teamCount < game.teamCount) {
				throw GameError(validationError(std::format("Team count can not shrink below {} during setup", game.teamCount)));
			}
			for (auto i = static_cast<std::size_t>(game.teamCount); i < *update.teamCount; ++i) {
				tx.insert(makeTeam(gameId, i));
			}
			game.teamCount = *update.teamCount;
		}
		game.phrasesPerPlayer = update.phrasesPerPlayer.value_or(game.phrasesPerPlayer);
		game.timerDuration    = update.timerDuration.value_or(game.timerDuration);

		refreshReadiness(tx, game);
		return game;
	});
}

Outcome<SubmitPhrasesResult> GameLobby::submitPhrases(const GameId& gameId, const PlayerId& playerId, const std::vector<std::string>& texts) {
	std::vector<std::string> cleaned;
	std::vector<std::string> errors;
	for (const auto& text: texts) {
		auto phrase = trim(text);
		if (auto problem = validatePhrase(phrase)) {
			errors.push_back(*problem);
			continue;
		}
		cleaned.push_back(std::move(phrase));
	}
	if (cleaned.empty() && errors.empty()) {
		errors.emplace_back("At least one phrase is required");
	}
	if (!errors.empty()) {
		return validationError("Invalid phrases", std::move(errors));
	}

	return runTransaction<SubmitPhrasesResult>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requireSetup(tx);
		requirePlayer(tx, playerId);

		std::unordered_set<std::string> seen;
		std::size_t existing = 0u;
		for (const auto& phrase: tx.phrases()) {
			seen.insert(lowercase(phrase.text));
			if (phrase.playerId == playerId) {
				++existing;
			}
		}
		for (const auto& text: cleaned) {
			if (!seen.insert(lowercase(text)).second) {
				throw GameError(validationError(std::format("Phrase '{}' already exists in this game", text)));
			}
		}
		if (existing + cleaned.size() > game.phrasesPerPlayer) {
			throw GameError(validationError(std::format("Players may submit at most {} phrases, {} already submitted", game.phrasesPerPlayer, existing)));
		}

		SubmitPhrasesResult result{.submittedCount = existing + cleaned.size(), .requiredCount = game.phrasesPerPlayer};
		for (auto& text: cleaned) {
			result.phrases.push_back(Phrase{.id = m_random.uuid(), .gameId = gameId, .playerId = playerId, .text = text});
			tx.insert(result.phrases.back());
		}

		refreshReadiness(tx, game);
		return result;
	});
}

Outcome<Phrase> GameLobby::updatePhrase(const GameId& gameId, const PlayerId& playerId, const PhraseId& phraseId, const std::string& text) {
	const auto cleaned = trim(text);
	if (auto problem = validatePhrase(cleaned)) {
		return validationError(*problem);
	}

	return runTransaction<Phrase>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requireSetup(tx);
		requirePlayer(tx, playerId);
		auto phrase = requirePhrase(tx, phraseId);
		if (phrase.playerId != playerId) {
			throw GameError(forbiddenError("Only the author can edit a phrase", phrase.playerId));
		}
		requireUniqueText(tx, cleaned, phrase.id);

		phrase.text = cleaned;
		tx.update(phrase);
		refreshReadiness(tx, game);
		return phrase;
	});
}

Outcome<Game> GameLobby::deletePhrase(const GameId& gameId, const PlayerId& playerId, const PhraseId& phraseId) {
	return runTransaction<Game>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requireSetup(tx);
		requirePlayer(tx, playerId);
		const auto phrase = requirePhrase(tx, phraseId);
		if (phrase.playerId != playerId && game.hostPlayerId != playerId) {
			throw GameError(forbiddenError("Only the author or the host can delete a phrase", phrase.playerId));
		}

		tx.remove(phrase);
		refreshReadiness(tx, game);

		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Phrase '{}' removed from game '{}'.", COMPONENT, phraseId, gameId));
		return game;
	});
}

Outcome<std::vector<PhraseListing>> GameLobby::listPhrases(const GameId& gameId, const PlayerId& requesterId) {
	return runTransaction<std::vector<PhraseListing>>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		const auto game = requireGame(tx);
		requirePlayer(tx, requesterId);
		if (requesterId != game.hostPlayerId) {
			throw GameError(forbiddenError("Only the host can view all phrases", game.hostPlayerId));
		}

		std::unordered_map<PlayerId, std::string> names;
		for (const auto& player: tx.players()) {
			names[player.id] = player.name;
		}

		std::vector<PhraseListing> listing;
		for (const auto& phrase: tx.phrases()) {
			listing.push_back({.phrase = phrase, .authorName = names[phrase.playerId]});
		}
		return listing;
	});
}

Outcome<std::vector<PhraseProgress>> GameLobby::phraseProgress(const GameId& gameId) {
	return runTransaction<std::vector<PhraseProgress>>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		const auto game = requireGame(tx);

		std::unordered_map<PlayerId, std::size_t> submitted;
		for (const auto& phrase: tx.phrases()) {
			++submitted[phrase.playerId];
		}

		std::vector<PhraseProgress> progress;
		for (const auto& player: tx.players()) {
			progress.push_back({.playerId = player.id, .playerName = player.name, .submitted = submitted[player.id], .required = game.phrasesPerPlayer});
		}
		return progress;
	});
}

Outcome<std::vector<std::string>> GameLobby::readiness(const GameId& gameId) {
	return runTransaction<std::vector<std::string>>(m_store, gameId, COMPONENT, [](ITransaction& tx) {
		const auto game = requireGame(tx);
		if (game.status != GameStatus::Setup) {
			return std::vector<std::string>{};
		}
		return startBlockers(tx, game);
	});
}

Game GameLobby::requireSetup(const ITransaction& transaction) const {
	auto game = requireGame(transaction);
	if (game.status != GameStatus::Setup) {
		throw GameError(stateConflictError("Game has already started", game.status, game.subStatus));
	}
	return game;
}

Phrase GameLobby::requirePhrase(const ITransaction& transaction, const PhraseId& phraseId) const {
	auto phrase = transaction.phrase(phraseId);
	if (!phrase) {
		throw GameError(notFoundError(std::format("Phrase '{}' not found", phraseId)));
	}
	return *phrase;
}

void GameLobby::requireUniqueText(const ITransaction& transaction, const std::string& text, const PhraseId& ignored) const {
	const auto key      = lowercase(text);
	const auto phrases  = transaction.phrases();
	const auto existing = std::any_of(phrases.begin(), phrases.end(), [&](const Phrase& p) { return p.id != ignored && lowercase(p.text) == key; });
	if (existing) {
		throw GameError(validationError(std::format("Phrase '{}' already exists in this game", text)));
	}
}

void GameLobby::refreshReadiness(ITransaction& transaction, Game& game) const {
	const auto ready = startBlockers(transaction, game).empty();
	game.subStatus   = ready ? SubStatus::ReadyToStart : SubStatus::WaitingForPlayers;
	transaction.update(game);
}

Team GameLobby::makeTeam(const GameId& gameId, std::size_t index) const {
	const auto& preset = TEAM_PRESETS.at(index);
	return Team{
	        .id        = m_random.uuid(),
	        .gameId    = gameId,
	        .name      = std::string(preset.name),
	        .color     = std::string(preset.color),
	        .createdAt = m_now(),
	};
}

} // namespace fishbowl
