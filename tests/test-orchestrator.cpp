/*
 * Unit tests for the peer connection orchestrator
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "roomcast-orchestrator.h"
#include "roomcast-test-fakes.h"

using namespace roomcast;
using namespace roomcast::test;

namespace
{

SignalMessage userJoined(const std::string &userId, Role role)
{
	SignalMessage message;
	message.kind = SignalKind::UserJoined;
	message.userId = userId;
	message.userRole = role;
	return message;
}

SignalMessage userLeft(const std::string &userId)
{
	SignalMessage message;
	message.kind = SignalKind::UserLeft;
	message.userId = userId;
	return message;
}

SignalMessage roomUsers(const std::vector<RoomMember> &users)
{
	SignalMessage message;
	message.kind = SignalKind::RoomUsers;
	message.users = users;
	return message;
}

SignalMessage offerFrom(const std::string &senderId, const std::string &sdp = "remote-offer")
{
	SignalMessage message;
	message.kind = SignalKind::Offer;
	message.senderId = senderId;
	message.description = {"offer", sdp};
	return message;
}

SignalMessage answerFrom(const std::string &senderId, const std::string &sdp = "remote-answer")
{
	SignalMessage message;
	message.kind = SignalKind::Answer;
	message.senderId = senderId;
	message.description = {"answer", sdp};
	return message;
}

SignalMessage candidateFrom(const std::string &senderId, const std::string &name)
{
	SignalMessage message;
	message.kind = SignalKind::IceCandidate;
	message.senderId = senderId;
	message.candidate = {"candidate:" + name, "0"};
	return message;
}

SignalMessage stateReportFrom(const std::string &senderId, const std::string &connectionState,
                              const std::string &iceState)
{
	SignalMessage message;
	message.kind = SignalKind::PeerConnectionState;
	message.senderId = senderId;
	message.userId = senderId;
	message.connectionState = connectionState;
	message.iceConnectionState = iceState;
	return message;
}

std::vector<std::string> candidateNames(const std::vector<IceCandidate> &candidates)
{
	std::vector<std::string> names;
	for (const auto &c : candidates) {
		names.push_back(c.candidate);
	}
	return names;
}

} // namespace

class PeerOrchestratorTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		settings.signalingUrl = "ws://relay.test";
		settings.roomId = "studio";
		settings.iceGatheringTimeoutMs = 1000;
		settings.maxRetryAttempts = 3;
		settings.retryBaseDelayMs = 1;
	}

	void TearDown() override { orchestrator.reset(); }

	void createAs(Role role, const std::string &userId)
	{
		settings.role = role;
		settings.userId = userId;
		orchestrator.reset(new PeerOrchestrator(link, factory, media, settings));
	}

	void startAs(Role role, const std::string &userId)
	{
		createAs(role, userId);
		orchestrator->start();
	}

	// Broadcaster with one viewer whose initial offer has gone out.
	std::shared_ptr<FakePeerState> startWithViewer(const std::string &viewerId)
	{
		startAs(Role::Broadcaster, "b1");
		link.deliver(userJoined(viewerId, Role::Viewer));
		EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 1, viewerId));
		return factory.peer(viewerId);
	}

	PeerSnapshot snapshotOf(const std::string &peerId)
	{
		PeerSnapshot snapshot;
		EXPECT_TRUE(orchestrator->peerSnapshot(peerId, snapshot)) << "no record for " << peerId;
		return snapshot;
	}

	bool waitForIdle(const std::string &peerId)
	{
		return waitUntil([&]() {
			PeerSnapshot snapshot;
			return orchestrator->peerSnapshot(peerId, snapshot) && !snapshot.isRetrying;
		});
	}

	size_t restartOffersSentTo(const std::string &peerId)
	{
		size_t count = 0;
		for (const auto &offer : link.sentOfKind(SignalKind::Offer, peerId)) {
			if (offer.description.sdp.find(":restart") != std::string::npos) {
				count++;
			}
		}
		return count;
	}

	OrchestratorSettings settings;
	FakeSignalingLink link;
	FakeTransportFactory factory;
	FakeCaptureDevice device;
	LocalMediaController media{&device};
	std::unique_ptr<PeerOrchestrator> orchestrator;
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(PeerOrchestratorTest, StartJoinsRoom)
{
	startAs(Role::Broadcaster, "b1");

	EXPECT_TRUE(orchestrator->isStarted());
	auto joins = link.sentOfKind(SignalKind::JoinRoom);
	ASSERT_EQ(joins.size(), 1u);
	EXPECT_EQ(joins[0].roomId, "studio");
	EXPECT_EQ(joins[0].userId, "b1");
	EXPECT_EQ(joins[0].userRole, Role::Broadcaster);
}

TEST_F(PeerOrchestratorTest, StartFailsFastWhenRelayIsUnreachable)
{
	createAs(Role::Viewer, "v1");
	link.setConnectSucceeds(false);

	try {
		orchestrator->start();
		FAIL() << "start should have thrown";
	} catch (const RoomcastError &e) {
		EXPECT_EQ(e.code(), ErrorCode::SignalingUnavailable);
	}
	EXPECT_FALSE(orchestrator->isStarted());
	EXPECT_EQ(link.countOfKind(SignalKind::JoinRoom), 0u);

	link.setConnectSucceeds(true);
	EXPECT_NO_THROW(orchestrator->start());
	EXPECT_TRUE(orchestrator->isStarted());
	EXPECT_EQ(link.connectAttempts(), 2);
}

TEST_F(PeerOrchestratorTest, StartTwiceThrowsAlreadyStarted)
{
	startAs(Role::Viewer, "v1");

	try {
		orchestrator->start();
		FAIL() << "second start should have thrown";
	} catch (const RoomcastError &e) {
		EXPECT_EQ(e.code(), ErrorCode::AlreadyStarted);
	}
	EXPECT_EQ(link.countOfKind(SignalKind::JoinRoom), 1u);
}

TEST_F(PeerOrchestratorTest, StartAfterShutdownThrowsShutDown)
{
	startAs(Role::Viewer, "v1");
	orchestrator->shutdown();

	try {
		orchestrator->start();
		FAIL() << "start after shutdown should have thrown";
	} catch (const RoomcastError &e) {
		EXPECT_EQ(e.code(), ErrorCode::ShutDown);
	}
}

TEST_F(PeerOrchestratorTest, StartRequiresIdentity)
{
	createAs(Role::Viewer, "v1");
	EXPECT_THROW(orchestrator->start(Role::Viewer, "", "studio"), RoomcastError);
	EXPECT_EQ(link.connectAttempts(), 0);
}

TEST_F(PeerOrchestratorTest, ShutdownIsIdempotentAndReleasesEverything)
{
	media.acquire(StreamKind::Camera);
	auto stream = media.current();

	auto v1 = startWithViewer("v1");
	link.deliver(userJoined("v2", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v2"));
	auto v2 = factory.peer("v2");

	orchestrator->shutdown();
	orchestrator->shutdown();

	EXPECT_TRUE(orchestrator->isShutDown());
	EXPECT_FALSE(orchestrator->isStarted());
	EXPECT_TRUE(orchestrator->peerIds().empty());
	EXPECT_TRUE(v1->isClosed());
	EXPECT_TRUE(v2->isClosed());
	EXPECT_EQ(link.countOfKind(SignalKind::LeaveRoom), 1u);
	EXPECT_FALSE(link.isConnected());
	EXPECT_FALSE(media.hasStream());
	EXPECT_FALSE(stream->tracks()[0]->isLive());
}

TEST_F(PeerOrchestratorTest, ConcurrentShutdownDuringHandshakeSendsNothingMore)
{
	startAs(Role::Broadcaster, "b1");
	factory.setOfferDelayMs("v1", 300);
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(waitUntil([&]() { return factory.peer("v1") != nullptr; }));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	std::thread first([&]() { orchestrator->shutdown(); });
	std::thread second([&]() { orchestrator->shutdown(); });
	first.join();
	second.join();

	EXPECT_EQ(link.countOfKind(SignalKind::Offer, "v1"), 0u);
	EXPECT_TRUE(factory.peer("v1")->isClosed());
	EXPECT_EQ(link.countOfKind(SignalKind::LeaveRoom), 1u);
}

TEST_F(PeerOrchestratorTest, SignalingLossDegradesWithoutClosingPeers)
{
	std::atomic<int> lost{0};
	createAs(Role::Broadcaster, "b1");
	orchestrator->setOnSignalingLost([&]() { lost++; });
	orchestrator->start();
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));

	link.dropConnection();

	EXPECT_TRUE(orchestrator->isSignalingDegraded());
	EXPECT_EQ(lost, 1);
	EXPECT_TRUE(orchestrator->hasPeer("v1"));
	EXPECT_FALSE(factory.peer("v1")->isClosed());

	factory.peer("v1")->emitLocalCandidate("candidate:late");
	EXPECT_GE(link.dropped(), 1);
}

// ---------------------------------------------------------------------------
// Offer side
// ---------------------------------------------------------------------------

TEST_F(PeerOrchestratorTest, BroadcasterSendsExactlyOneOfferPerJoinedViewer)
{
	startWithViewer("v1");
	std::this_thread::sleep_for(std::chrono::milliseconds(100));

	auto offers = link.sentOfKind(SignalKind::Offer, "v1");
	ASSERT_EQ(offers.size(), 1u);
	EXPECT_EQ(offers[0].description.sdp, "offer:v1");
	EXPECT_EQ(offers[0].roomId, "studio");
	EXPECT_EQ(factory.createdFor("v1"), 1u);
}

TEST_F(PeerOrchestratorTest, BroadcasterIgnoresOtherBroadcastersAndItself)
{
	startAs(Role::Broadcaster, "b1");
	link.deliver(userJoined("b2", Role::Broadcaster));
	link.deliver(userJoined("b1", Role::Viewer));

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_TRUE(orchestrator->peerIds().empty());
	EXPECT_EQ(link.countOfKind(SignalKind::Offer), 0u);
}

TEST_F(PeerOrchestratorTest, ViewerNeverInitiates)
{
	startAs(Role::Viewer, "v1");
	link.deliver(userJoined("b1", Role::Broadcaster));
	link.deliver(userJoined("v2", Role::Viewer));
	orchestrator->onPeerJoined("v3", Role::Viewer);

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_TRUE(orchestrator->peerIds().empty());
	EXPECT_EQ(link.countOfKind(SignalKind::Offer), 0u);
}

TEST_F(PeerOrchestratorTest, RosterOffersToEveryViewer)
{
	std::mutex mutex;
	std::vector<std::string> joined;
	createAs(Role::Broadcaster, "b1");
	orchestrator->setOnUserJoined([&](const RoomMember &member) {
		std::lock_guard<std::mutex> lock(mutex);
		joined.push_back(member.userId);
	});
	orchestrator->start();

	link.deliver(roomUsers({{"b1", Role::Broadcaster},
	                        {"v1", Role::Viewer},
	                        {"v2", Role::Viewer},
	                        {"b2", Role::Broadcaster}}));

	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));
	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v2"));
	EXPECT_FALSE(orchestrator->hasPeer("b2"));

	std::lock_guard<std::mutex> lock(mutex);
	EXPECT_EQ(joined, (std::vector<std::string>{"v1", "v2", "b2"}));
}

TEST_F(PeerOrchestratorTest, ReturningViewerReusesRecordAndRenegotiates)
{
	startWithViewer("v1");
	link.deliver(userJoined("v1", Role::Viewer));

	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 2, "v1"));
	EXPECT_EQ(factory.createdFor("v1"), 1u);
}

TEST_F(PeerOrchestratorTest, TransportCreationFailureLeavesNoRecord)
{
	startAs(Role::Broadcaster, "b1");
	factory.setFailCreate(true);
	link.deliver(userJoined("v1", Role::Viewer));

	EXPECT_FALSE(orchestrator->hasPeer("v1"));
	EXPECT_EQ(link.countOfKind(SignalKind::Offer), 0u);
}

TEST_F(PeerOrchestratorTest, GatheringWaitIsBounded)
{
	settings.iceGatheringTimeoutMs = 50;
	factory.setAutoCompleteGathering(false);

	startAs(Role::Broadcaster, "b1");
	const auto begin = std::chrono::steady_clock::now();
	link.deliver(userJoined("v1", Role::Viewer));

	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1", 1000));
	EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1000));
}

TEST_F(PeerOrchestratorTest, GatheringCompletionReleasesOfferEarly)
{
	settings.iceGatheringTimeoutMs = 5000;
	factory.setAutoCompleteGathering(false);

	startAs(Role::Broadcaster, "b1");
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(waitUntil([&]() {
		auto peer = factory.peer("v1");
		return peer && peer->gatheringState() == GatheringState::InProgress;
	}));

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_EQ(link.countOfKind(SignalKind::Offer, "v1"), 0u);

	factory.peer("v1")->completeGathering();
	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1", 1000));
}

TEST_F(PeerOrchestratorTest, LocalCandidatesAreForwardedToPeer)
{
	auto v1 = startWithViewer("v1");
	v1->emitLocalCandidate("candidate:local-1");

	auto candidates = link.sentOfKind(SignalKind::IceCandidate, "v1");
	ASSERT_EQ(candidates.size(), 1u);
	EXPECT_EQ(candidates[0].candidate.candidate, "candidate:local-1");
	EXPECT_EQ(candidates[0].candidate.mid, "0");
}

// ---------------------------------------------------------------------------
// Answer side and candidates
// ---------------------------------------------------------------------------

TEST_F(PeerOrchestratorTest, ViewerAnswersOfferExactlyOnce)
{
	startAs(Role::Viewer, "v1");
	link.deliver(offerFrom("b1", "offer-sdp"));

	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));
	std::this_thread::sleep_for(std::chrono::milliseconds(100));

	auto answers = link.sentOfKind(SignalKind::Answer, "b1");
	ASSERT_EQ(answers.size(), 1u);
	EXPECT_EQ(answers[0].description.sdp, "answer:b1");

	auto remotes = factory.peer("b1")->remoteDescriptions();
	ASSERT_EQ(remotes.size(), 1u);
	EXPECT_EQ(remotes[0].type, "offer");
	EXPECT_EQ(remotes[0].sdp, "offer-sdp");
	EXPECT_EQ(snapshotOf("b1").remoteRole, Role::Broadcaster);
}

TEST_F(PeerOrchestratorTest, CandidateArrivingDuringRemoteDescriptionIsBufferedThenApplied)
{
	startAs(Role::Viewer, "v1");
	factory.setBeforeRemoteDescription(
	    [this](const std::string &peerId) { orchestrator->onSignalingMessage(candidateFrom(peerId, "racing")); });

	link.deliver(offerFrom("b1"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));

	EXPECT_EQ(candidateNames(factory.peer("b1")->appliedCandidates()),
	          (std::vector<std::string>{"candidate:racing"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("b1"), 0u);
}

TEST_F(PeerOrchestratorTest, EarlyCandidatesAreAdoptedAndFlushedInArrivalOrder)
{
	startAs(Role::Viewer, "v1");
	link.deliver(candidateFrom("b1", "c1"));
	link.deliver(candidateFrom("b1", "c2"));
	link.deliver(candidateFrom("b1", "c3"));

	EXPECT_FALSE(orchestrator->hasPeer("b1"));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("b1"), 3u);

	link.deliver(offerFrom("b1"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));

	EXPECT_EQ(candidateNames(factory.peer("b1")->appliedCandidates()),
	          (std::vector<std::string>{"candidate:c1", "candidate:c2", "candidate:c3"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("b1"), 0u);
}

TEST_F(PeerOrchestratorTest, CandidatesBeforeAnswerAreBufferedThenFlushedInOrder)
{
	auto v1 = startWithViewer("v1");
	link.deliver(candidateFrom("v1", "c1"));
	link.deliver(candidateFrom("v1", "c2"));

	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 2u);
	EXPECT_FALSE(snapshotOf("v1").remoteDescriptionSet);
	EXPECT_TRUE(v1->appliedCandidates().empty());

	link.deliver(answerFrom("v1"));
	EXPECT_EQ(candidateNames(v1->appliedCandidates()),
	          (std::vector<std::string>{"candidate:c1", "candidate:c2"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 0u);

	link.deliver(candidateFrom("v1", "c3"));
	EXPECT_EQ(candidateNames(v1->appliedCandidates()),
	          (std::vector<std::string>{"candidate:c1", "candidate:c2", "candidate:c3"}));
}

TEST_F(PeerOrchestratorTest, RejectedCandidateIsRetriedOnNextRemoteDescription)
{
	auto v1 = startWithViewer("v1");
	link.deliver(candidateFrom("v1", "c1"));
	link.deliver(candidateFrom("v1", "c2"));
	v1->failNextCandidates(1);

	link.deliver(answerFrom("v1"));
	EXPECT_EQ(candidateNames(v1->appliedCandidates()), (std::vector<std::string>{"candidate:c2"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 1u);

	link.deliver(answerFrom("v1", "renegotiated"));
	EXPECT_EQ(candidateNames(v1->appliedCandidates()),
	          (std::vector<std::string>{"candidate:c2", "candidate:c1"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 0u);
}

TEST_F(PeerOrchestratorTest, RejectedCandidateIsRetriedWithNextInboundCandidate)
{
	auto v1 = startWithViewer("v1");
	link.deliver(answerFrom("v1"));
	v1->failNextCandidates(1);

	link.deliver(candidateFrom("v1", "c1"));
	EXPECT_TRUE(v1->appliedCandidates().empty());
	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 1u);

	link.deliver(candidateFrom("v1", "c2"));
	EXPECT_EQ(candidateNames(v1->appliedCandidates()),
	          (std::vector<std::string>{"candidate:c1", "candidate:c2"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 0u);
}

TEST_F(PeerOrchestratorTest, RejectedCandidateIsRetriedWhenGatheringCompletes)
{
	auto v1 = startWithViewer("v1");
	link.deliver(answerFrom("v1"));
	v1->failNextCandidates(1);

	link.deliver(candidateFrom("v1", "c1"));
	ASSERT_EQ(orchestrator->bufferedCandidateCount("v1"), 1u);

	v1->completeGathering();
	EXPECT_EQ(candidateNames(v1->appliedCandidates()), (std::vector<std::string>{"candidate:c1"}));
	EXPECT_EQ(orchestrator->bufferedCandidateCount("v1"), 0u);
}

TEST_F(PeerOrchestratorTest, AnswerForUnknownPeerIsDropped)
{
	startAs(Role::Broadcaster, "b1");
	link.deliver(answerFrom("ghost"));

	EXPECT_FALSE(orchestrator->hasPeer("ghost"));
	EXPECT_EQ(factory.createdFor("ghost"), 0u);
}

TEST_F(PeerOrchestratorTest, AnswerCompletesOfferAndAppliesDescription)
{
	auto v1 = startWithViewer("v1");
	link.deliver(answerFrom("v1", "viewer-answer"));

	auto remotes = v1->remoteDescriptions();
	ASSERT_EQ(remotes.size(), 1u);
	EXPECT_EQ(remotes[0].type, "answer");
	EXPECT_EQ(remotes[0].sdp, "viewer-answer");
	EXPECT_TRUE(snapshotOf("v1").remoteDescriptionSet);
}

TEST_F(PeerOrchestratorTest, RenegotiationOfferReusesRecord)
{
	startAs(Role::Viewer, "v1");
	link.deliver(offerFrom("b1", "first"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));
	link.deliver(offerFrom("b1", "second"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 2, "b1"));

	EXPECT_EQ(factory.createdFor("b1"), 1u);
	EXPECT_EQ(factory.peer("b1")->remoteDescriptions().size(), 2u);
}

TEST_F(PeerOrchestratorTest, UnknownMessagesAreIgnored)
{
	startAs(Role::Viewer, "v1");
	SignalMessage message;
	message.kind = SignalKind::Unknown;
	message.type = "chat-message";
	link.deliver(message);

	SignalMessage error;
	error.kind = SignalKind::Error;
	error.message = "Room is full";
	link.deliver(error);

	EXPECT_TRUE(orchestrator->peerIds().empty());
	EXPECT_TRUE(orchestrator->isStarted());
}

// ---------------------------------------------------------------------------
// Peer lifecycle
// ---------------------------------------------------------------------------

TEST_F(PeerOrchestratorTest, UserLeftClosesPeer)
{
	std::vector<std::string> left;
	createAs(Role::Broadcaster, "b1");
	orchestrator->setOnUserLeft([&](const std::string &peerId) { left.push_back(peerId); });
	orchestrator->start();
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));

	link.deliver(userLeft("v1"));

	EXPECT_FALSE(orchestrator->hasPeer("v1"));
	EXPECT_TRUE(factory.peer("v1")->isClosed());
	EXPECT_EQ(left, (std::vector<std::string>{"v1"}));
}

TEST_F(PeerOrchestratorTest, StateChangesAreAnnouncedAndReported)
{
	std::mutex mutex;
	std::vector<ConnectionState> states;
	createAs(Role::Broadcaster, "b1");
	orchestrator->setOnPeerStateChanged([&](const std::string &peerId, ConnectionState state) {
		std::lock_guard<std::mutex> lock(mutex);
		if (peerId == "v1") {
			states.push_back(state);
		}
	});
	orchestrator->start();
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));

	factory.peer("v1")->emitConnectionState(ConnectionState::Connected);

	auto reports = link.sentOfKind(SignalKind::PeerConnectionState, "v1");
	ASSERT_EQ(reports.size(), 1u);
	EXPECT_EQ(reports[0].userId, "b1");
	EXPECT_EQ(reports[0].connectionState, "connected");
	EXPECT_EQ(snapshotOf("v1").state, ConnectionState::Connected);

	std::lock_guard<std::mutex> lock(mutex);
	EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Connected}));
}

TEST_F(PeerOrchestratorTest, RemoteTrackReachesObserver)
{
	std::string fromPeer;
	std::shared_ptr<MediaTrack> received;
	createAs(Role::Viewer, "v1");
	orchestrator->setOnRemoteTrack([&](const std::string &peerId, const std::shared_ptr<MediaTrack> &track) {
		fromPeer = peerId;
		received = track;
	});
	orchestrator->start();
	link.deliver(offerFrom("b1"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));

	auto track = std::make_shared<MediaTrack>(TrackKind::Video, "remote-video");
	factory.peer("b1")->emitRemoteTrack(track);

	EXPECT_EQ(fromPeer, "b1");
	EXPECT_EQ(received, track);
}

// ---------------------------------------------------------------------------
// Recovery
// ---------------------------------------------------------------------------

TEST_F(PeerOrchestratorTest, FailureTriggersIceRestartAndConnectedResetsRetries)
{
	auto v1 = startWithViewer("v1");

	v1->emitConnectionState(ConnectionState::Failed);
	ASSERT_TRUE(waitUntil([&]() { return restartOffersSentTo("v1") == 1; }));
	ASSERT_TRUE(waitForIdle("v1"));

	auto snapshot = snapshotOf("v1");
	EXPECT_EQ(snapshot.retryCount, 1);
	EXPECT_FALSE(snapshot.permanentlyFailed);
	EXPECT_EQ(link.sentOfKind(SignalKind::Offer, "v1").back().description.sdp, "offer:v1:restart");

	v1->emitConnectionState(ConnectionState::Connected);
	snapshot = snapshotOf("v1");
	EXPECT_EQ(snapshot.retryCount, 0);
	EXPECT_FALSE(snapshot.isRetrying);
}

TEST_F(PeerOrchestratorTest, IceFailureAlsoTriggersRecovery)
{
	auto v1 = startWithViewer("v1");

	v1->emitIceState(IceConnectionState::Disconnected);
	EXPECT_TRUE(waitUntil([&]() { return restartOffersSentTo("v1") == 1; }));

	ASSERT_TRUE(waitForIdle("v1"));
	v1->emitIceState(IceConnectionState::Completed);
	EXPECT_EQ(snapshotOf("v1").retryCount, 0);
}

TEST_F(PeerOrchestratorTest, RetryBudgetIsCappedAndRecordKept)
{
	settings.maxRetryAttempts = 2;
	auto v1 = startWithViewer("v1");

	for (size_t attempt = 1; attempt <= 2; attempt++) {
		v1->emitConnectionState(ConnectionState::Failed);
		ASSERT_TRUE(waitUntil([&]() { return restartOffersSentTo("v1") == attempt; })) << "attempt " << attempt;
		ASSERT_TRUE(waitForIdle("v1"));
	}

	v1->emitConnectionState(ConnectionState::Failed);
	std::this_thread::sleep_for(std::chrono::milliseconds(100));

	EXPECT_EQ(restartOffersSentTo("v1"), 2u);
	EXPECT_EQ(v1->restartOffersCreated(), 2);
	auto snapshot = snapshotOf("v1");
	EXPECT_TRUE(snapshot.permanentlyFailed);
	EXPECT_EQ(snapshot.retryCount, 2);
	EXPECT_TRUE(orchestrator->hasPeer("v1"));

	v1->emitConnectionState(ConnectionState::Connected);
	snapshot = snapshotOf("v1");
	EXPECT_FALSE(snapshot.permanentlyFailed);
	EXPECT_EQ(snapshot.retryCount, 0);
}

TEST_F(PeerOrchestratorTest, RecoveryIsDisabledBySettings)
{
	settings.enableRecovery = false;
	auto v1 = startWithViewer("v1");

	v1->emitConnectionState(ConnectionState::Failed);
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	EXPECT_EQ(restartOffersSentTo("v1"), 0u);
	EXPECT_EQ(snapshotOf("v1").retryCount, 0);
}

TEST_F(PeerOrchestratorTest, RecoveringOnePeerLeavesOthersUntouched)
{
	auto v1 = startWithViewer("v1");
	link.deliver(userJoined("v2", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v2"));

	v1->emitConnectionState(ConnectionState::Failed);
	ASSERT_TRUE(waitUntil([&]() { return restartOffersSentTo("v1") == 1; }));

	auto other = snapshotOf("v2");
	EXPECT_EQ(other.retryCount, 0);
	EXPECT_FALSE(other.isRetrying);
	EXPECT_EQ(restartOffersSentTo("v2"), 0u);
	EXPECT_EQ(link.countOfKind(SignalKind::Offer, "v2"), 1u);
}

TEST_F(PeerOrchestratorTest, SlowPeerDoesNotDelayOthers)
{
	startAs(Role::Broadcaster, "b1");
	factory.setOfferDelayMs("v1", 1000);

	link.deliver(userJoined("v1", Role::Viewer));
	link.deliver(userJoined("v2", Role::Viewer));

	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v2", 400));
	EXPECT_EQ(link.countOfKind(SignalKind::Offer, "v1"), 0u);
	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1", 3000));
}

TEST_F(PeerOrchestratorTest, StalledRestartDoesNotBlockSignalingForOtherPeers)
{
	auto v1 = startWithViewer("v1");
	v1->offerDelayMs = 1500;

	v1->emitConnectionState(ConnectionState::Failed);
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	const auto begin = std::chrono::steady_clock::now();
	link.deliver(userJoined("v2", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v2", 400));

	link.deliver(answerFrom("v2"));
	auto v2 = factory.peer("v2");
	ASSERT_TRUE(waitUntil([&]() { return !v2->remoteDescriptions().empty(); }, 400));
	EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(800));
	EXPECT_EQ(restartOffersSentTo("v1"), 0u);

	EXPECT_TRUE(waitUntil([&]() { return restartOffersSentTo("v1") == 1; }, 4000));
}

TEST_F(PeerOrchestratorTest, RemoteFailureReportTriggersBroadcasterRecovery)
{
	startWithViewer("v1");

	link.deliver(stateReportFrom("v1", "failed", "failed"));

	EXPECT_TRUE(waitUntil([&]() { return restartOffersSentTo("v1") == 1; }));
}

TEST_F(PeerOrchestratorTest, ViewerDoesNotRestartOrRecoverFromDisconnect)
{
	startAs(Role::Viewer, "v1");
	link.deliver(offerFrom("b1"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));
	auto b1 = factory.peer("b1");

	b1->emitConnectionState(ConnectionState::Disconnected);
	EXPECT_EQ(snapshotOf("b1").retryCount, 0);

	b1->emitConnectionState(ConnectionState::Failed);
	EXPECT_EQ(snapshotOf("b1").retryCount, 1);
	ASSERT_TRUE(waitForIdle("b1"));

	EXPECT_EQ(link.countOfKind(SignalKind::Offer), 0u);
	EXPECT_EQ(b1->offersCreated(), 0);
}

TEST_F(PeerOrchestratorTest, ViewerIgnoresRemoteStateReports)
{
	startAs(Role::Viewer, "v1");
	link.deliver(offerFrom("b1"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Answer, 1, "b1"));

	link.deliver(stateReportFrom("b1", "failed", "failed"));
	EXPECT_EQ(snapshotOf("b1").retryCount, 0);
}

// ---------------------------------------------------------------------------
// Local stream
// ---------------------------------------------------------------------------

TEST_F(PeerOrchestratorTest, LocalStreamIsAttachedToInitialOffer)
{
	createAs(Role::Broadcaster, "b1");
	auto camera = orchestrator->startLocalStream(StreamKind::Camera);
	orchestrator->start();

	auto streamTypes = link.sentOfKind(SignalKind::StreamType);
	ASSERT_EQ(streamTypes.size(), 1u);
	EXPECT_EQ(streamTypes[0].streamKind, StreamKind::Camera);

	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));

	auto v1 = factory.peer("v1");
	EXPECT_EQ(v1->senderTrack(TrackKind::Audio), camera->track(TrackKind::Audio));
	EXPECT_EQ(v1->senderTrack(TrackKind::Video), camera->track(TrackKind::Video));
}

TEST_F(PeerOrchestratorTest, SwitchingStreamKeepsOneSenderPerKind)
{
	createAs(Role::Broadcaster, "b1");
	auto camera = orchestrator->startLocalStream(StreamKind::Camera);
	orchestrator->start();
	link.deliver(userJoined("v1", Role::Viewer));
	link.deliver(userJoined("v2", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v2"));

	auto screen = orchestrator->switchLocalStream(StreamKind::Screen);
	ASSERT_NE(screen, nullptr);
	EXPECT_EQ(orchestrator->localStream(), screen);

	for (const char *peerId : {"v1", "v2"}) {
		auto peer = factory.peer(peerId);
		EXPECT_EQ(peer->senderCount(), 2u) << peerId;
		EXPECT_EQ(peer->addTrackCalls(TrackKind::Audio), 1) << peerId;
		EXPECT_EQ(peer->addTrackCalls(TrackKind::Video), 1) << peerId;
		EXPECT_EQ(peer->senderTrack(TrackKind::Video), screen->track(TrackKind::Video)) << peerId;
		EXPECT_EQ(peer->senderTrack(TrackKind::Audio), screen->track(TrackKind::Audio)) << peerId;
	}

	EXPECT_FALSE(camera->track(TrackKind::Video)->isLive());
	EXPECT_EQ(link.sentOfKind(SignalKind::StreamType).back().streamKind, StreamKind::Screen);
}

TEST_F(PeerOrchestratorTest, FailedSwitchLeavesPeersWithoutSourceButConnected)
{
	createAs(Role::Broadcaster, "b1");
	orchestrator->startLocalStream(StreamKind::Camera);
	orchestrator->start();
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));

	device.deny(StreamKind::Screen);
	EXPECT_THROW(orchestrator->switchLocalStream(StreamKind::Screen), RoomcastError);

	auto v1 = factory.peer("v1");
	EXPECT_EQ(orchestrator->localStream(), nullptr);
	EXPECT_EQ(v1->senderCount(), 2u);
	EXPECT_EQ(v1->senderTrack(TrackKind::Video), nullptr);
	EXPECT_FALSE(v1->isClosed());
	EXPECT_TRUE(orchestrator->hasPeer("v1"));
}

TEST_F(PeerOrchestratorTest, StreamStartedAfterPeersRenegotiates)
{
	auto v1 = startWithViewer("v1");
	EXPECT_EQ(v1->senderCount(), 0u);

	orchestrator->startLocalStream(StreamKind::Camera);

	EXPECT_TRUE(link.waitForCount(SignalKind::Offer, 2, "v1"));
	EXPECT_EQ(v1->senderCount(), 2u);
	EXPECT_EQ(link.sentOfKind(SignalKind::StreamType).back().streamKind, StreamKind::Camera);
}

TEST_F(PeerOrchestratorTest, ClearingStreamDetachesSources)
{
	createAs(Role::Broadcaster, "b1");
	orchestrator->startLocalStream(StreamKind::Camera);
	orchestrator->start();
	link.deliver(userJoined("v1", Role::Viewer));
	ASSERT_TRUE(link.waitForCount(SignalKind::Offer, 1, "v1"));

	orchestrator->clearLocalStream();

	auto v1 = factory.peer("v1");
	EXPECT_EQ(v1->senderCount(), 2u);
	EXPECT_EQ(v1->senderTrack(TrackKind::Audio), nullptr);
	EXPECT_EQ(v1->senderTrack(TrackKind::Video), nullptr);
	EXPECT_EQ(orchestrator->localStream(), nullptr);
}

TEST_F(PeerOrchestratorTest, AdoptedStreamIsPublished)
{
	auto v1 = startWithViewer("v1");
	auto external = std::make_shared<MediaStream>(
	    StreamKind::Screen,
	    std::vector<std::shared_ptr<MediaTrack>>{std::make_shared<MediaTrack>(TrackKind::Video, "external")});

	orchestrator->setLocalStream(external);

	EXPECT_EQ(orchestrator->localStream(), external);
	EXPECT_EQ(v1->senderTrack(TrackKind::Video), external->track(TrackKind::Video));
	EXPECT_EQ(v1->addTrackCalls(TrackKind::Audio), 0);
}
