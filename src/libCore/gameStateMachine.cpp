#include "core/gameStateMachine.hpp"

#include "Logging.hpp"
#include "transactionRunner.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace fishbowl {

static constexpr std::string_view COMPONENT = "StateMachine";

//! Phrase can be drawn from the bowl in round. Phrases guessed in an earlier round are played again.
static bool inPlay(const Phrase& phrase, unsigned round) {
	if (phrase.status == PhraseStatus::Active) {
		return true;
	}
	return phrase.status == PhraseStatus::Guessed && phrase.guessedInRound && *phrase.guessedInRound < round;
}

static std::size_t countInPlay(const std::vector<Phrase>& phrases, unsigned round) {
	return static_cast<std::size_t>(std::count_if(phrases.begin(), phrases.end(), [round](const Phrase& p) { return inPlay(p, round); }));
}

GameStateMachine::GameStateMachine(IEntityStore& store, Random& random, EventHub& events, NowFunction now)
    : m_store(store), m_random(random), m_events(events), m_now(std::move(now)), m_builder(random), m_navigator(random) {
}

Outcome<StartGameResult> GameStateMachine::startGame(const GameId& gameId) {
	std::vector<GameEvent> events;

	auto outcome = runTransaction<StartGameResult>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requireGame(tx);
		if (game.status != GameStatus::Setup) {
			throw GameError(stateConflictError("Game has already started", game.status, game.subStatus));
		}
		if (auto blockers = startBlockers(tx, game); !blockers.empty()) {
			throw GameError(validationError("Game is not ready to start", std::move(blockers)));
		}

		auto sequence = m_builder.build(tx);
		if (const auto report = checkRing(tx); !report.valid()) {
			throw GameError(integrityError(report.message));
		}

		const auto first = m_navigator.randomStartPlayer(tx);
		if (!first) {
			throw GameError(noEligiblePlayerError("No connected player can take the first turn"));
		}

		auto turn = makeTurn(tx, game, *first, 1u);
		tx.insert(turn);

		game.status        = GameStatus::Playing;
		game.subStatus     = SubStatus::RoundIntro;
		game.currentRound  = 1u;
		game.currentTurnId = turn.id;
		game.startedAt     = m_now();
		tx.update(game);

		events.emplace_back(GameStartedEvent{.gameId = gameId, .turnOrderSize = sequence.size(), .firstTurnId = turn.id, .firstPlayerId = *first});
		return StartGameResult{.game = game, .turnOrder = std::move(sequence), .firstTurn = turn, .firstPlayer = playerInfo(tx, *first)};
	});

	if (succeeded(outcome)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Game '{}' started.", COMPONENT, gameId));
		publish(events);
	}
	return outcome;
}

Outcome<StartRoundResult> GameStateMachine::startRound(const GameId& gameId) {
	std::vector<GameEvent> events;

	auto outcome = runTransaction<StartRoundResult>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::RoundIntro, SubStatus::RoundComplete}, "Game is not in the correct state to start a round");

		if (game.subStatus == SubStatus::RoundComplete) {
			if (game.currentRound >= ROUND_COUNT) {
				throw GameError(stateConflictError("All rounds have been played", game.status, game.subStatus));
			}
			++game.currentRound;
		}

		std::optional<Turn> current;
		if (game.currentTurnId) {
			current = tx.turn(*game.currentTurnId);
		}

		Turn turn;
		if (current && !current->isComplete) {
			// Pending opening turn of this round. Hand it on if its player dropped out meanwhile.
			auto starter = std::optional<PlayerId>(current->playerId);
			if (!m_navigator.isPlayerActive(tx, current->playerId)) {
				starter = m_navigator.nextPlayer(tx, current->playerId);
			}
			if (!starter) {
				throw GameError(noEligiblePlayerError("No connected player can start the round"));
			}

			turn    = makeTurn(tx, game, *starter, game.currentRound);
			turn.id = current->id;
			tx.update(turn);
		} else {
			const auto starter = current ? m_navigator.nextPlayer(tx, current->playerId) : m_navigator.randomStartPlayer(tx);
			if (!starter) {
				throw GameError(noEligiblePlayerError("No connected player can start the round"));
			}

			turn = makeTurn(tx, game, *starter, game.currentRound);
			tx.insert(turn);
		}

		std::size_t reset = 0u;
		for (auto phrase: tx.phrases()) {
			if (phrase.status == PhraseStatus::Skipped) {
				phrase.status = PhraseStatus::Active;
				tx.update(phrase);
				++reset;
			}
		}

		game.subStatus     = SubStatus::TurnStarting;
		game.currentTurnId = turn.id;
		tx.update(game);

		const auto name = std::string(roundName(game.currentRound));
		events.emplace_back(RoundStartedEvent{
		        .gameId    = gameId,
		        .round     = game.currentRound,
		        .roundName = name,
		        .turnId    = turn.id,
		        .playerId  = turn.playerId,
		        .teamId    = turn.teamId,
		});
		return StartRoundResult{
		        .round         = game.currentRound,
		        .roundName     = name,
		        .currentTurn   = turn,
		        .currentPlayer = playerInfo(tx, turn.playerId),
		        .startedAt     = m_now(),
		        .resetPhrases  = reset,
		};
	});

	if (const auto* result = std::get_if<StartRoundResult>(&outcome)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Game '{}' round {} ({}) started.", COMPONENT, gameId, result->round, result->roundName));
		publish(events);
	}
	return outcome;
}

Outcome<Turn> GameStateMachine::startTurn(const GameId& gameId, const PlayerId& playerId) {
	std::vector<GameEvent> events;

	auto outcome = runTransaction<Turn>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::TurnStarting}, "Turn can only be started while it is starting");
		auto turn = requireCurrentTurn(tx, game);
		requireActor(turn, playerId);

		turn.startTime = m_now();
		tx.update(turn);

		game.subStatus = SubStatus::TurnActive;
		tx.update(game);

		events.emplace_back(TurnStartedEvent{
		        .gameId        = gameId,
		        .turnId        = turn.id,
		        .playerId      = turn.playerId,
		        .teamId        = turn.teamId,
		        .round         = turn.round,
		        .timerDuration = game.timerDuration,
		});
		return turn;
	});

	if (succeeded(outcome)) {
		publish(events);
	}
	return outcome;
}

Outcome<RecordPhraseResult> GameStateMachine::recordPhrase(const GameId& gameId, const PlayerId& playerId, const PhraseId& phraseId, PhraseAction action) {
	std::vector<GameEvent> events;

	auto outcome = runTransaction<RecordPhraseResult>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::TurnActive}, "Phrases can only be recorded during an active turn");
		auto turn = requireCurrentTurn(tx, game);
		requireActor(turn, playerId);

		auto phrase = tx.phrase(phraseId);
		if (!phrase) {
			throw GameError(notFoundError(std::format("Phrase '{}' not found", phraseId)));
		}
		if (!inPlay(*phrase, game.currentRound)) {
			throw GameError(validationError(std::format("Phrase '{}' is not in play", phraseId)));
		}

		if (action == PhraseAction::Guessed) {
			phrase->status          = PhraseStatus::Guessed;
			phrase->guessedInRound  = game.currentRound;
			phrase->guessedByTeamId = turn.teamId;
			++turn.phrasesGuessed;
			++turn.pointsScored;
		} else {
			phrase->status = PhraseStatus::Skipped;
			++turn.phrasesSkipped;
		}
		tx.update(*phrase);
		tx.update(turn);

		const auto remaining = countInPlay(tx.phrases(), game.currentRound);

		RecordPhraseResult result{.phrase = *phrase, .turn = turn, .remainingPhrases = remaining, .roundComplete = false, .gameComplete = false};
		if (remaining != 0u) {
			return result;
		}

		// Bowl is empty: the acting turn ends with the round.
		completeTurn(tx, turn);
		result.turn          = turn;
		result.roundComplete = true;

		TurnEndedEvent ended{.gameId = gameId, .turnId = turn.id, .playerId = turn.playerId, .teamId = turn.teamId, .pointsScored = turn.pointsScored};
		if (game.currentRound >= ROUND_COUNT) {
			game.status         = GameStatus::Finished;
			game.subStatus      = SubStatus::GameComplete;
			game.finishedAt     = m_now();
			result.gameComplete = true;
		} else {
			// Opening turn of the next round, held until the round is started.
			const auto next = m_navigator.nextPlayer(tx, turn.playerId).value_or(turn.playerId);
			auto pending    = makeTurn(tx, game, next, game.currentRound + 1u);
			tx.insert(pending);

			game.subStatus     = SubStatus::RoundComplete;
			game.currentTurnId = pending.id;
			ended.nextTurnId   = pending.id;
			ended.nextPlayerId = pending.playerId;
		}
		tx.update(game);

		events.emplace_back(ended);
		events.emplace_back(RoundCompletedEvent{.gameId = gameId, .round = game.currentRound});
		if (result.gameComplete) {
			events.emplace_back(GameCompletedEvent{.gameId = gameId});
		}
		return result;
	});

	if (const auto* result = std::get_if<RecordPhraseResult>(&outcome); result && result->roundComplete) {
		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Game '{}' completed a round{}.", COMPONENT, gameId, result->gameComplete ? " and finished" : ""));
	}
	if (succeeded(outcome)) {
		publish(events);
	}
	return outcome;
}

Outcome<Game> GameStateMachine::pauseTurn(const GameId& gameId, PauseReason reason) {
	return runTransaction<Game>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::TurnActive}, "Only an active turn can be paused");
		auto turn = requireCurrentTurn(tx, game);

		turn.pausedAt     = m_now();
		turn.pausedReason = reason;
		tx.update(turn);

		game.subStatus = SubStatus::TurnPaused;
		tx.update(game);

		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Game '{}' turn '{}' paused ({}).", COMPONENT, gameId, turn.id, toString(reason)));
		return game;
	});
}

Outcome<Game> GameStateMachine::resumeTurn(const GameId& gameId) {
	return runTransaction<Game>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::TurnPaused}, "Turn is not paused");
		auto turn = requireCurrentTurn(tx, game);

		turn.pausedAt.reset();
		turn.pausedReason.reset();
		tx.update(turn);

		game.subStatus = SubStatus::TurnActive;
		tx.update(game);
		return game;
	});
}

Outcome<EndTurnResult> GameStateMachine::endTurn(const GameId& gameId, const PlayerId& playerId, const std::optional<TurnId>& expectedTurnId) {
	std::vector<GameEvent> events;

	auto outcome = runTransaction<EndTurnResult>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::TurnStarting, SubStatus::TurnActive, SubStatus::TurnPaused}, "No turn is in progress");
		auto turn = requireCurrentTurn(tx, game);
		if (expectedTurnId && *expectedTurnId != turn.id) {
			throw GameError(stateConflictError(std::format("Turn '{}' has already ended", *expectedTurnId), game.status, game.subStatus));
		}
		requireActor(turn, playerId);

		completeTurn(tx, turn);

		const auto next = m_navigator.nextPlayer(tx, playerId);
		if (!next) {
			throw GameError(noEligiblePlayerError("No connected player can take the next turn"));
		}

		auto nextTurn = makeTurn(tx, game, *next, game.currentRound);
		tx.insert(nextTurn);

		game.subStatus     = SubStatus::TurnStarting;
		game.currentTurnId = nextTurn.id;
		tx.update(game);

		events.emplace_back(TurnEndedEvent{
		        .gameId       = gameId,
		        .turnId       = turn.id,
		        .playerId     = turn.playerId,
		        .teamId       = turn.teamId,
		        .pointsScored = turn.pointsScored,
		        .nextTurnId   = nextTurn.id,
		        .nextPlayerId = nextTurn.playerId,
		});
		return EndTurnResult{.completedTurn = turn, .nextTurn = nextTurn, .nextPlayer = playerInfo(tx, *next), .game = game};
	});

	if (const auto* result = std::get_if<EndTurnResult>(&outcome)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[{}] Game '{}' turn '{}' ended with {} points, next player '{}'.", COMPONENT, gameId,
		                                                  result->completedTurn.id, result->completedTurn.pointsScored, result->nextPlayer.name));
		publish(events);
	}
	return outcome;
}

Outcome<Game> GameStateMachine::advanceRound(const GameId& gameId) {
	return runTransaction<Game>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		auto game = requirePhase(tx, {SubStatus::RoundComplete}, "Round is not complete");
		if (game.currentRound >= ROUND_COUNT) {
			throw GameError(stateConflictError("All rounds have been played", game.status, game.subStatus));
		}

		++game.currentRound;
		game.subStatus = SubStatus::RoundIntro;
		tx.update(game);
		return game;
	});
}

Outcome<GameSnapshot> GameStateMachine::snapshot(const GameId& gameId) {
	return runTransaction<GameSnapshot>(m_store, gameId, COMPONENT, [&](ITransaction& tx) {
		GameSnapshot snapshot{.game = requireGame(tx), .teams = tx.teams(), .players = tx.players()};

		if (snapshot.game.currentTurnId) {
			snapshot.currentTurn = tx.turn(*snapshot.game.currentTurnId);
		}

		snapshot.activePhrases = countInPlay(tx.phrases(), snapshot.game.currentRound);

		auto nodes = tx.turnOrder();
		std::sort(nodes.begin(), nodes.end(), [](const TurnOrderNode& lhs, const TurnOrderNode& rhs) { return lhs.position < rhs.position; });
		for (const auto& node: nodes) {
			snapshot.turnOrder.push_back(node.playerId);
		}
		return snapshot;
	});
}

Outcome<RingReport> GameStateMachine::verifyTurnOrder(const GameId& gameId) {
	return runTransaction<RingReport>(m_store, gameId, COMPONENT, [](ITransaction& tx) {
		requireGame(tx);
		return checkRing(tx);
	});
}

Game GameStateMachine::requirePhase(const ITransaction& transaction, std::initializer_list<SubStatus> allowed, std::string_view message) const {
	auto game = requireGame(transaction);
	if (game.status != GameStatus::Playing || std::find(allowed.begin(), allowed.end(), game.subStatus) == allowed.end()) {
		throw GameError(stateConflictError(std::string(message), game.status, game.subStatus));
	}
	return game;
}

Turn GameStateMachine::requireCurrentTurn(const ITransaction& transaction, const Game& game) const {
	std::optional<Turn> turn;
	if (game.currentTurnId) {
		turn = transaction.turn(*game.currentTurnId);
	}
	if (!turn || turn->isComplete) {
		throw GameError(stateConflictError("Game has no turn in progress", game.status, game.subStatus));
	}
	return *turn;
}

void GameStateMachine::requireActor(const Turn& turn, const PlayerId& playerId) {
	if (turn.playerId != playerId) {
		throw GameError(forbiddenError("It is not your turn", turn.playerId));
	}
}

Turn GameStateMachine::makeTurn(const ITransaction& transaction, const Game& game, const PlayerId& playerId, unsigned round) const {
	const auto player = requirePlayer(transaction, playerId);
	if (!player.teamId) {
		throw GameError(integrityError(std::format("Player '{}' in the turn order has no team", playerId)));
	}

	return Turn{
	        .id       = m_random.uuid(),
	        .gameId   = game.id,
	        .round    = round,
	        .teamId   = *player.teamId,
	        .playerId = playerId,
	};
}

void GameStateMachine::completeTurn(ITransaction& transaction, Turn& turn) const {
	const auto now = m_now();

	turn.isComplete = true;
	turn.endTime    = now;
	if (turn.startTime) {
		const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *turn.startTime).count();
		turn.duration      = static_cast<unsigned>(std::max<decltype(elapsed)>(elapsed, 0));
	}
	transaction.update(turn);

	auto team = transaction.team(turn.teamId);
	if (!team) {
		throw GameError(integrityError(std::format("Team '{}' of turn '{}' not found", turn.teamId, turn.id)));
	}
	team->roundScores.at(turn.round - 1u) += turn.pointsScored;
	team->totalScore += turn.pointsScored;
	transaction.update(*team);
}

PlayerInfo GameStateMachine::playerInfo(const ITransaction& transaction, const PlayerId& playerId) const {
	const auto player = requirePlayer(transaction, playerId);
	return PlayerInfo{.id = player.id, .name = player.name, .teamId = player.teamId.value_or(TeamId{})};
}

void GameStateMachine::publish(const std::vector<GameEvent>& events) {
	for (const auto& event: events) {
		m_events.publish(event);
	}
}

} // namespace fishbowl
