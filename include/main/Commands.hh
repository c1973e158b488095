/** \file
 *
 * \brief Definition of \ref clueprotocol commands
 *
 * \page clueprotocol Clue protocol
 *
 * This document describes the Clue protocol version 0.1.
 *
 * The key words “MUST”, “MUST NOT”, “REQUIRED”, “SHALL”, “SHALL NOT”, “SHOULD”,
 * “SHOULD NOT”, “RECOMMENDED”, “MAY”, and “OPTIONAL” in this document are to be
 * interpreted as described in RFC 2119 (http://tools.ietf.org/html/rfc2119).
 *
 * \section clueprotocolintro Introduction
 *
 * This document describes a protocol for playing the simplified Clue board
 * game over network. A single server hosts any number of games, and the
 * clients act for the players taking part in them. The server keeps the
 * authoritative state of each game and enforces the rules.
 *
 * \section clueprotocoltransport Transport
 *
 * The protocol uses ZMTP 3.0 over TCP (https://rfc.zeromq.org/spec:23/ZMTP).
 *
 * The server
 *
 * - MUST open a control socket (ROUTER) the clients connect to
 * - MUST open an event socket (PUB) the clients can subscribe for events
 * - MUST handle commands specified in \ref clueprotocolcontrolmessage
 * - MUST publish events specified in \ref clueprotocoleventmessage
 * - MUST keep a running counter for synchronization purposes
 *
 * The clients
 *
 * - MUST communicate with the server using \ref clueprotocolcontrolmessage
 * - SHOULD subscribe to the event socket of the server
 *
 * \section clueprotocolplayers Players
 *
 * Games and players are identified by UUIDs. A client MAY act for any number
 * of players. The first client that successfully joins a game with a player
 * UUID controls the player, and the server MUST reject commands from other
 * clients acting for it. Clients are identified by the User-Id of the
 * connection if the connection is authenticated, and by the routing ID
 * otherwise. A client reconnecting with the same identity regains the control
 * of its players.
 *
 * The nil UUID (00000000-0000-0000-0000-000000000000) is reserved for the
 * implementation and MUST NOT be used to identify games or players.
 *
 * \section clueprotocolcontrolmessage Command messages
 *
 * A \b command is a multipart message consisting of an empty frame, a tag
 * frame and a command identifier frame, followed by key–value pairs of
 * parameters. The command identifiers and keys are printable ASCII
 * strings. The parameter values are UTF‐8 encoded JSON documents.
 *
 * \b Example. A valid command to move a player to the study would consist of
 * the following nine frames:
 *
 * | N | Content                                | Notes                        |
 * |---|----------------------------------------|------------------------------|
 * | 1 |                                        | Empty frame                  |
 * | 2 | MYTAG                                  | Client chosen tag            |
 * | 3 | move                                   | Command identifier           |
 * | 4 | game                                   | Key for game argument        |
 * | 5 | "9c3fc66b-ab10-4006-8c15-3b4f7eb04846" | Quotes required (valid JSON) |
 * | 6 | player                                 | Key for player argument      |
 * | 7 | "8bc7c6ca-1f19-440c-b5e2-88dc049bca53" |                              |
 * | 8 | location                               | Key for location argument    |
 * | 9 | "study"                                |                              |
 *
 * Clients using DEALER sockets MUST send the empty frame. Clients using REQ
 * sockets get it added by their socket.
 *
 * Commands with additional unspecified arguments MUST be accepted. Unrecognized
 * arguments SHOULD be ignored.
 *
 * \section clueprotocolreplymessage Reply messages
 *
 * The server MUST send a \b reply message to a client sending a command. The
 * prefix of a reply consists of an empty frame, a tag frame and a status
 * frame. The status frame is “OK” for a successful reply, or starts with
 * “ERR” for a failed reply. The parameters of a successful reply follow the
 * status frame as key–value pairs.
 *
 * A failed status MAY have a suffix separated by a colon:
 *
 * - “ERR:UNK” when the client has not sent the cluehlo command, or the
 *   command is not recognized
 * - “ERR:<kind>” when the command violates the rules of the game, where kind
 *   is one of the following: NotYourTurn, Eliminated, GameOver, SameLocation,
 *   InvalidMove, HallwayOccupied, NotInRoom, NotHost, InsufficientPlayers,
 *   CapacityExceeded, AlreadyStarted, SessionNotFound, NotStarted,
 *   UnknownPlayer, CharacterTaken, DisprovePending, NoPendingDisprove,
 *   NotDisprover, InvalidCard, SessionAborted
 *
 * A plain “ERR” reply means that the command was malformed, or that the
 * client is not allowed to act for the player.
 *
 * A failed command MUST NOT change the state of the game.
 *
 * \section clueprotocoleventmessage Event messages
 *
 * The server MUST publish \b event messages through its event socket when the
 * state of a game changes. An event message consists of an event frame
 * followed by key–value pairs. The event frame is the UUID of the game in the
 * canonical form, a colon, and the event type.
 *
 * \b Example. A notification about a player moving would consist of the
 * following frames:
 *
 * | N | Content                                    | Notes
 * |---|--------------------------------------------|-----------------------
 * | 1 | 9c3fc66b-ab10-4006-8c15-3b4f7eb04846:move  | Event type
 * | 2 | player                                     | Argument key
 * | 3 | "8bc7c6ca-1f19-440c-b5e2-88dc049bca53"     | Argument value (JSON)
 * | 4 | location                                   | Argument key
 * | 5 | "hallway1"                                 | Argument value (JSON)
 * | 6 | counter                                    | Running counter
 * | 7 | 12                                         |
 *
 * Events never contain the hands of the players or the cards revealed to a
 * suggester.
 *
 * \section clueprotocolcounter Running counter
 *
 * Each event contains a \e counter argument. The counter values of the events
 * of a game form a strictly increasing sequence. The reply to the \ref
 * clueprotocolcontrolget command contains the current counter. A client
 * combining the snapshot with the event stream SHOULD ignore any event with
 * a counter less than the one returned with the snapshot.
 *
 * \section clueprotocolcontrolcommands Control commands
 *
 * \subsection clueprotocolcontrolcluehlo cluehlo
 *
 * - \b Command: cluehlo
 * - \b Parameters:
 *   - \e version: a string containing the version of the protocol
 *   - \e role: the string “client”
 * - \b Reply: \e none
 *
 * Each client MUST start the connection (including after reconnecting) by
 * sending the cluehlo command. A server following this protocol
 * specification MUST use "0.1" as the version number.
 *
 * \subsection clueprotocolcontrolgame game
 *
 * - \b Command: game
 * - \b Parameters:
 *   - \e game: the UUID of the new game (optional)
 * - \b Reply:
 *   - \e game: the UUID of the game created
 *
 * Create a new game in the lobby. If the UUID is omitted, the server
 * generates one. The command fails if a game with the UUID exists.
 *
 * \subsection clueprotocolcontroljoin join
 *
 * - \b Command: join
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player (optional)
 *   - \e character: the preferred character (optional)
 * - \b Reply:
 *   - \e game: the game joined
 *   - \e player: the UUID of the player
 *   - \e character: the character assigned to the player
 *
 * Join a player to a game in the lobby, or reconnect a known player to a game
 * in any state. If the player is omitted, the server generates one. The
 * preferred character is honored if it is available. Otherwise the first
 * available character is assigned.
 *
 * \subsection clueprotocolcontrolleave leave
 *
 * - \b Command: leave
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player
 * - \b Reply: \e none
 *
 * Disconnect a player. The player keeps its character and hand, and MAY
 * reconnect with the join command.
 *
 * \subsection clueprotocolcontrolget get
 *
 * - \b Command: get
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player
 *   - \e get: an array of keys to retrieve (optional)
 * - \b Reply:
 *   - \e get: an object containing the requested keys
 *   - \e counter: the running counter
 *
 * The get object contains the following keys, or the ones listed in the get
 * argument:
 *
 * - \e pubstate: the public state of the game, including the status, the
 *   host, the turn holder, the winner, the players and the character tokens
 * - \e privstate: the hand of the player and the outcome of its latest
 *   suggestion
 * - \e self: the player, its character and the pending disprove choice of
 *   the player, if any
 * - \e history: the public events of the game in the order they occurred
 *
 * The case file is only included in pubstate after the game was won.
 *
 * \subsection clueprotocolcontrolstartgame start_game
 *
 * - \b Command: start_game
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the host
 * - \b Reply: \e none
 *
 * Deal the cards and give the turn to the first player.
 *
 * \subsection clueprotocolcontrolmove move
 *
 * - \b Command: move
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player
 *   - \e location: the room or hallway, see \ref jsonlocation
 * - \b Reply: \e none
 *
 * \subsection clueprotocolcontrolsuggest suggest
 *
 * - \b Command: suggest
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player
 *   - \e suspect: the suspected character
 *   - \e weapon: the suspected weapon
 * - \b Reply:
 *   - \e outcome: the outcome of the suggestion, see \ref jsonsession
 *
 * The room of the suggestion is the room the player is in.
 *
 * \subsection clueprotocolcontroldisprove disprove
 *
 * - \b Command: disprove
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the disprover
 *   - \e card: the card revealed to the suggester, see \ref jsoncard
 * - \b Reply: \e none
 *
 * \subsection clueprotocolcontrolaccuse accuse
 *
 * - \b Command: accuse
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player
 *   - \e suspect: the accused character
 *   - \e weapon: the accused weapon
 *   - \e room: the accused room
 * - \b Reply:
 *   - \e outcome: “win”, “eliminated” or “tie”
 *
 * \subsection clueprotocolcontrolendturn end_turn
 *
 * - \b Command: end_turn
 * - \b Parameters:
 *   - \e game: the UUID of the game
 *   - \e player: the UUID of the player
 * - \b Reply: \e none
 *
 * \section clueprotocolevents Events
 *
 * - \e join: player, character
 * - \e leave: player
 * - \e host: player
 * - \e start: players
 * - \e turn: player
 * - \e move: player, location
 * - \e suggest: player, suspect, weapon, room
 * - \e disprove: player (the suggester), disprover
 * - \e suggestionend: player
 * - \e accuse: player, outcome
 * - \e end: player (the winner, null for a tie), and the case file as
 *   suspect, weapon and room if the game was won
 * - \e update: pubstate
 */

#ifndef MAIN_COMMANDS_HH_
#define MAIN_COMMANDS_HH_

#include <string>

namespace Clue {
namespace Main {

/** \brief See \ref clueprotocolcontrolcluehlo
 */
extern const std::string HELLO_COMMAND;

/** \brief See \ref clueprotocolcontrolcluehlo
 */
extern const std::string VERSION_COMMAND;

/** \brief See \ref clueprotocolcontrolcluehlo
 */
extern const std::string ROLE_COMMAND;

/** \brief See \ref clueprotocolcontrolgame
 */
extern const std::string GAME_COMMAND;

/** \brief See \ref clueprotocolcontroljoin
 */
extern const std::string JOIN_COMMAND;

/** \brief See \ref clueprotocolcontrolleave
 */
extern const std::string LEAVE_COMMAND;

/** \brief See \ref clueprotocolcontrolget
 */
extern const std::string GET_COMMAND;

/** \brief See \ref clueprotocolcontrolstartgame
 */
extern const std::string START_GAME_COMMAND;

/** \brief See \ref clueprotocolcontrolmove
 */
extern const std::string MOVE_COMMAND;

/** \brief See \ref clueprotocolcontrolsuggest
 */
extern const std::string SUGGEST_COMMAND;

/** \brief See \ref clueprotocolcontroldisprove
 */
extern const std::string DISPROVE_COMMAND;

/** \brief See \ref clueprotocolcontrolaccuse
 */
extern const std::string ACCUSE_COMMAND;

/** \brief See \ref clueprotocolcontrolendturn
 */
extern const std::string END_TURN_COMMAND;

/** \brief See \ref clueprotocolcontroljoin
 */
extern const std::string PLAYER_COMMAND;

/** \brief See \ref clueprotocolcontroljoin
 */
extern const std::string CHARACTER_COMMAND;

/** \brief See \ref clueprotocolcontrolmove
 */
extern const std::string LOCATION_COMMAND;

/** \brief See \ref clueprotocolcontrolsuggest
 */
extern const std::string SUSPECT_COMMAND;

/** \brief See \ref clueprotocolcontrolsuggest
 */
extern const std::string WEAPON_COMMAND;

/** \brief See \ref clueprotocolcontrolaccuse
 */
extern const std::string ROOM_COMMAND;

/** \brief See \ref clueprotocolcontroldisprove
 */
extern const std::string CARD_COMMAND;

/** \brief See \ref clueprotocolcontrolsuggest
 */
extern const std::string OUTCOME_COMMAND;

/** \brief See \ref clueprotocolcounter
 */
extern const std::string COUNTER_COMMAND;

/** \brief See \ref clueprotocolcontrolget
 */
extern const std::string PUBSTATE_COMMAND;

/** \brief See \ref clueprotocolcontrolget
 */
extern const std::string PRIVSTATE_COMMAND;

/** \brief See \ref clueprotocolcontrolget
 */
extern const std::string SELF_COMMAND;

/** \brief See \ref clueprotocolcontrolget
 */
extern const std::string HISTORY_COMMAND;

/// \brief Key for the status of a game in pubstate
extern const std::string STATUS_COMMAND;

/// \brief Key for the host of a game in pubstate
extern const std::string HOST_COMMAND;

/// \brief Key for the turn holder in pubstate
extern const std::string TURN_COMMAND;

/// \brief Key for the winner in pubstate
extern const std::string WINNER_COMMAND;

/// \brief Key for the list of players in pubstate
extern const std::string PLAYERS_COMMAND;

/// \brief Key for the character tokens in pubstate
extern const std::string TOKENS_COMMAND;

/// \brief Key for the solution in pubstate
extern const std::string CASE_FILE_COMMAND;

/// \brief Key for the participation of a player in pubstate
extern const std::string PARTICIPATION_COMMAND;

/// \brief Key for whether a player is connected and playing
extern const std::string ACTIVE_COMMAND;

/// \brief Key for whether a player has been eliminated
extern const std::string ELIMINATED_COMMAND;

/// \brief Key for whether a player has the turn
extern const std::string IS_TURN_COMMAND;

/// \brief Key for the hand of a player in privstate
extern const std::string HAND_COMMAND;

/// \brief Key for the latest suggestion outcome in privstate
extern const std::string LAST_OUTCOME_COMMAND;

/// \brief Key for a pending disprove choice in self
extern const std::string PENDING_DISPROVE_COMMAND;

/// \brief Key for the disprover of a suggestion
extern const std::string DISPROVER_COMMAND;

/// \brief Key for the cards the disprover may reveal
extern const std::string MATCHING_CARDS_COMMAND;

/// \brief Key for the disprove request identifier
extern const std::string REQUEST_COMMAND;

/// \brief Key for the event type of a history entry
extern const std::string EVENT_COMMAND;

/** \brief See \ref clueprotocolevents
 */
extern const std::string START_COMMAND;

/** \brief See \ref clueprotocolevents
 */
extern const std::string SUGGESTION_END_COMMAND;

/** \brief See \ref clueprotocolevents
 */
extern const std::string END_COMMAND;

/** \brief See \ref clueprotocolevents
 */
extern const std::string UPDATE_COMMAND;

}
}

#endif // MAIN_COMMANDS_HH_
