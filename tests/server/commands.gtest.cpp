#include "server/commands.hpp"

#include <gtest/gtest.h>

namespace fishbowl::gtest {

using namespace server;

template <class T>
static T parsed(std::string_view payload) {
	const auto command = parseCommand(payload);
	if (!command || !std::holds_alternative<T>(*command)) {
		ADD_FAILURE() << "Unexpected parse result for '" << payload << "'";
		return T{};
	}
	return std::get<T>(*command);
}

TEST(Commands, CreateGame) {
	const auto plain = parsed<CreateGameCommand>("CREATE:Friday:Ann");
	EXPECT_EQ(plain.gameName, "Friday");
	EXPECT_EQ(plain.hostName, "Ann");
	EXPECT_EQ(plain.config.teamCount, GameConfig{}.teamCount);

	const auto configured = parsed<CreateGameCommand>("CREATE:Friday:Ann:3:4:90");
	EXPECT_EQ(configured.config.teamCount, 3u);
	EXPECT_EQ(configured.config.phrasesPerPlayer, 4u);
	EXPECT_EQ(configured.config.timerDuration, 90u);

	EXPECT_FALSE(parseCommand("CREATE:Friday").has_value());
	EXPECT_FALSE(parseCommand("CREATE:Friday:Ann:3:x:90").has_value());
	EXPECT_FALSE(parseCommand("CREATE:Friday:Ann:3").has_value());
}

TEST(Commands, JoinVariants) {
	const auto joinGame = parsed<JoinGameCommand>("JOIN_GAME:ABC123:Bob");
	EXPECT_EQ(joinGame.gameId, "ABC123");
	EXPECT_EQ(joinGame.playerName, "Bob");

	const auto join = parsed<JoinCommand>("JOIN:ABC123:player-1");
	EXPECT_EQ(join.gameId, "ABC123");
	EXPECT_EQ(join.playerId, "player-1");

	EXPECT_FALSE(parseCommand("JOIN:ABC123").has_value());
	EXPECT_FALSE(parseCommand("JOIN_GAME::Bob").has_value());
	parsed<LeaveCommand>("LEAVE");
	EXPECT_FALSE(parseCommand("LEAVE:now").has_value());
}

TEST(Commands, ConfigKeepsEmptyFieldsUnset) {
	const auto command = parsed<UpdateConfigCommand>("CONFIG::4:");
	EXPECT_FALSE(command.update.teamCount.has_value());
	EXPECT_EQ(command.update.phrasesPerPlayer, 4u);
	EXPECT_FALSE(command.update.timerDuration.has_value());

	EXPECT_FALSE(parseCommand("CONFIG:3:4").has_value());
	EXPECT_FALSE(parseCommand("CONFIG:3:-4:60").has_value());
}

TEST(Commands, PhrasesMayContainColons) {
	const auto command = parsed<SubmitPhrasesCommand>("PHRASES:Star Wars: A New Hope|Tea|");
	ASSERT_EQ(command.phrases.size(), 3u);
	EXPECT_EQ(command.phrases[0], "Star Wars: A New Hope");
	EXPECT_EQ(command.phrases[1], "Tea");
	EXPECT_EQ(command.phrases[2], "");

	EXPECT_FALSE(parseCommand("PHRASES").has_value());
	EXPECT_FALSE(parseCommand("PHRASES:").has_value());
}

TEST(Commands, PhraseEditing) {
	const auto edit = parsed<EditPhraseCommand>("PHRASE_EDIT:phrase-7:Star Wars: A New Hope");
	EXPECT_EQ(edit.phraseId, "phrase-7");
	EXPECT_EQ(edit.text, "Star Wars: A New Hope");
	EXPECT_EQ(parsed<EditPhraseCommand>("PHRASE_EDIT:phrase-7:").text, "");
	EXPECT_FALSE(parseCommand("PHRASE_EDIT:phrase-7").has_value());
	EXPECT_FALSE(parseCommand("PHRASE_EDIT::text").has_value());
	EXPECT_FALSE(parseCommand("PHRASE_EDIT").has_value());

	EXPECT_EQ(parsed<DeletePhraseCommand>("PHRASE_DELETE:phrase-7").phraseId, "phrase-7");
	EXPECT_FALSE(parseCommand("PHRASE_DELETE").has_value());
	EXPECT_FALSE(parseCommand("PHRASE_DELETE:a:b").has_value());

	parsed<ListPhrasesCommand>("PHRASE_LIST");
	EXPECT_FALSE(parseCommand("PHRASE_LIST:all").has_value());
}

TEST(Commands, GameplayCommands) {
	const auto guess = parsed<RecordPhraseCommand>("GUESS:phrase-7");
	EXPECT_EQ(guess.phraseId, "phrase-7");
	EXPECT_EQ(guess.action, PhraseAction::Guessed);
	EXPECT_EQ(parsed<RecordPhraseCommand>("SKIP:phrase-7").action, PhraseAction::Skipped);
	EXPECT_FALSE(parseCommand("GUESS").has_value());

	EXPECT_FALSE(parsed<EndTurnCommand>("END_TURN").expectedTurnId.has_value());
	EXPECT_EQ(parsed<EndTurnCommand>("END_TURN:turn-3").expectedTurnId, "turn-3");
	EXPECT_EQ(parsed<AssignTeamCommand>("TEAM:team-2").teamId, "team-2");

	parsed<StartGameCommand>("START_GAME");
	parsed<StartRoundCommand>("START_ROUND");
	parsed<NextRoundCommand>("NEXT_ROUND");
	parsed<StartTurnCommand>("START_TURN");
	parsed<PauseCommand>("PAUSE");
	parsed<ResumeCommand>("RESUME");
	parsed<StateCommand>("STATE");

	EXPECT_FALSE(parseCommand("START_GAME:now").has_value());
	EXPECT_FALSE(parseCommand("state").has_value());
	EXPECT_FALSE(parseCommand("").has_value());
}

TEST(Commands, Names) {
	EXPECT_EQ(commandName(*parseCommand("END_TURN:t")), "END_TURN");
	EXPECT_EQ(commandName(*parseCommand("SKIP:p")), "SKIP");
	EXPECT_EQ(commandName(*parseCommand("PHRASES:a")), "PHRASES");
	EXPECT_EQ(commandName(*parseCommand("PHRASE_EDIT:p:a")), "PHRASE_EDIT");
	EXPECT_EQ(commandName(*parseCommand("PHRASE_DELETE:p")), "PHRASE_DELETE");
}

TEST(Commands, Replies) {
	EXPECT_EQ(formatOk("PAUSE"), "OK:PAUSE");
	EXPECT_EQ(formatOk("START_TURN", {{"turn", "t1"}}), "OK:START_TURN:turn=t1");
	EXPECT_EQ(formatOk("PHRASES", {{"submitted", "2"}, {"required", "5"}}), "OK:PHRASES:submitted=2;required=5");

	EXPECT_EQ(formatError(forbiddenError("It is not your turn", "p1")), "ERROR:forbidden:It is not your turn");
	EXPECT_EQ(formatError(notFoundError("Phrase 'x' not found")), "ERROR:not_found:Phrase 'x' not found");
}

TEST(Commands, Events) {
	EXPECT_EQ(formatEvent(RoundCompletedEvent{.gameId = "G1", .round = 2u}), "EVENT:round_completed:game=G1;round=2");
	EXPECT_EQ(formatEvent(GameCompletedEvent{.gameId = "G1"}), "EVENT:game_completed:game=G1");

	TurnEndedEvent ended{.gameId = "G1", .turnId = "t1", .playerId = "p1", .teamId = "a", .pointsScored = 3u};
	EXPECT_EQ(formatEvent(ended), "EVENT:turn_ended:game=G1;turn=t1;player=p1;team=a;points=3");

	ended.nextTurnId   = "t2";
	ended.nextPlayerId = "p2";
	EXPECT_EQ(formatEvent(ended), "EVENT:turn_ended:game=G1;turn=t1;player=p1;team=a;points=3;next_turn=t2;next_player=p2");

	EXPECT_EQ(formatEvent("turn_resumed", {{"game", "G1"}}), "EVENT:turn_resumed:game=G1");
}

} // namespace fishbowl::gtest
