#pragma once

#include <migration/codec/Messages.h>
#include <migration/state/MigrationSession.h>

namespace migration {

/**
 * Returns true if a session can move from one state to the other. Moving to
 * the current state is always allowed, except from STOPPED which is
 * absorbing.
 * @param from  the current state.
 * @param to    the requested state.
 */
bool isValidTransition(MigrationState from, MigrationState to);

/**
 * Changes the state of a session. Throws a MigrationInternalException with
 * INVALID_OPERATION if the transition is not allowed.
 * @param session  the session.
 * @param state    the new state.
 * @return         true if the state changed.
 */
bool updateSessionState(MigrationSession& session, MigrationState state);

/**
 * Returns true if a message received in the given state must be processed.
 * In the final states only the messages that end the session are accepted,
 * and nothing is accepted once STOPPED.
 */
bool acceptsMessage(MigrationState state, MigrationMessage::Type type);

/**
 * Returns true if the session reached the point where the migration can be
 * terminated: both sides have sent and received the account, and the state
 * is either WAIT_ACCOUNT or TERMINATE.
 */
bool canTerminate(const MigrationSession& session);

/**
 * Checks that the peer can hold the data that will be transferred, using
 * the statistics it reported. Throws a MigrationException with
 * INTERNAL_ERROR if the statistics were never received, or NO_SPACE_LEFT
 * if the database or the files do not fit.
 * @param peerInfo  the statistics reported by the peer.
 */
void checkPeerCapacity(const folly::Optional<QueryInfo>& peerInfo);

/**
 * Sets the byte totals of a session from the database sizes exchanged
 * during the negotiation. Files are added to the totals when listed.
 */
void initializeTransferTotals(MigrationSession& session);

/**
 * Prepares a session to resume after a reconnection. The progress counters
 * are cleared and the database totals restored; the files already on disk
 * are reported again when listed.
 */
void resetSessionForRestart(MigrationSession& session);

/**
 * Records the reception of the peer account.
 * @param session          the session.
 * @param answersRequest   true if the account answers our own account.
 * @param hasPeerAccount   true if the peer already received our account.
 * @return                 true if the account exchange is now complete
 *                         and the session moved to TERMINATE.
 */
bool onAccountExchanged(
    MigrationSession& session,
    bool answersRequest,
    bool hasPeerAccount);

/**
 * Computes the status reported to the observers.
 * @param session    the session.
 * @param connected  true if the channel is open.
 */
MigrationStatus computeMigrationStatus(
    const MigrationSession& session,
    bool connected);

} // namespace migration
