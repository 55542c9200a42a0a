#include <gtest/gtest.h>

#include "negotiation/NegotiationCoordinator.h"
#include "utils/ChannelCrypto.h"
#include "FakeMediaEngine.h"

#include <QScopedPointer>

namespace {

// Captures everything a coordinator wants to put on the relay.
struct Outbox {
    explicit Outbox(NegotiationCoordinator* c) {
        QObject::connect(c, &NegotiationCoordinator::envelopeReady, [this](const RelayEnvelope& env) {
            sent.append(env);
        });
        QObject::connect(c, &NegotiationCoordinator::negotiationFailed, [this](const QString& peer, const QString&) {
            failed.append(peer);
        });
        QObject::connect(c, &NegotiationCoordinator::peerRemoved, [this](const QString& peer) {
            removed.append(peer);
        });
    }

    int count(RelayEnvelope::Type type, const QString& to = QString()) const {
        int n = 0;
        for (const RelayEnvelope& env : sent) {
            if (env.type == type && (to.isEmpty() || env.to == to)) ++n;
        }
        return n;
    }

    QList<RelayEnvelope> sent;
    QStringList failed;
    QStringList removed;
};

RelayEnvelope offerFrom(const QString& from, const QString& to) {
    return RelayEnvelope::offer(from, to, QJsonObject{{"type", "offer"}, {"sdp", from + "->" + to}});
}

RelayEnvelope answerFrom(const QString& from, const QString& to) {
    return RelayEnvelope::answer(from, to, QJsonObject{{"type", "answer"}, {"sdp", from + "->" + to}});
}

}

TEST(NegotiationOrderTest, SmallerIdOffers) {
    EXPECT_TRUE(NegotiationCoordinator::shouldInitiate("a1", "b2"));
    EXPECT_FALSE(NegotiationCoordinator::shouldInitiate("b2", "a1"));
    EXPECT_FALSE(NegotiationCoordinator::shouldInitiate("a1", "a1"));
    EXPECT_TRUE(NegotiationCoordinator::shouldInitiate("A", "a"));
}

class NegotiationCoordinatorTest : public ::testing::Test {
protected:
    FakeMediaEngine engine{"a1"};
    NegotiationCoordinator coordinator{"a1", &engine};
    Outbox out{&coordinator};
};

TEST_F(NegotiationCoordinatorTest, OffersToLargerPeerAndConnectsOnAnswer) {
    coordinator.handlePeerJoined("b2");

    ASSERT_TRUE(coordinator.hasLink("b2"));
    EXPECT_EQ(coordinator.linkState("b2"), NegotiationState::OfferSent);
    ASSERT_EQ(out.count(RelayEnvelope::Type::Offer, "b2"), 1);
    EXPECT_EQ(out.sent[0].from, "a1");
    EXPECT_EQ(out.sent[0].payload.toObject()["type"].toString(), "offer");
    EXPECT_TRUE(engine.calls.contains("local:b2:offer"));

    coordinator.handleEnvelope(answerFrom("b2", "a1"));
    EXPECT_EQ(coordinator.linkState("b2"), NegotiationState::Connected);
    EXPECT_TRUE(engine.calls.contains("remote:b2:answer"));
}

TEST_F(NegotiationCoordinatorTest, WaitsForSmallerPeerToOffer) {
    coordinator.handlePeerJoined("0host");
    EXPECT_FALSE(coordinator.hasLink("0host"));
    EXPECT_TRUE(out.sent.isEmpty());
    EXPECT_TRUE(engine.calls.isEmpty());
}

TEST_F(NegotiationCoordinatorTest, RepeatedPeerJoinedKeepsOneLink) {
    coordinator.handlePeerJoined("b2");
    coordinator.handlePeerJoined("b2");
    coordinator.handleWelcome({{"b2", "Bob"}});

    EXPECT_EQ(coordinator.linkCount(), 1);
    EXPECT_EQ(engine.calls.count("offer:b2"), 1);
    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer), 1);
}

TEST_F(NegotiationCoordinatorTest, WelcomeOffersOnlyWhereLocalIdIsSmaller) {
    coordinator.handleWelcome({{"0host", "Host"}, {"b2", "Bob"}, {"c3", "Carol"}, {"a1", "Self"}});
    EXPECT_EQ(coordinator.linkCount(), 2);
    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer, "b2"), 1);
    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer, "c3"), 1);
    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer, "0host"), 0);
}

TEST_F(NegotiationCoordinatorTest, AnswersIncomingOffer) {
    coordinator.handleEnvelope(offerFrom("0host", "a1"));

    ASSERT_TRUE(coordinator.hasLink("0host"));
    EXPECT_EQ(coordinator.linkState("0host"), NegotiationState::Connected);
    ASSERT_EQ(out.count(RelayEnvelope::Type::Answer, "0host"), 1);
    EXPECT_EQ(engine.calls, QStringList({"open:0host", "remote:0host:offer", "answer:0host", "local:0host:answer"}));
}

TEST_F(NegotiationCoordinatorTest, UnexpectedOfferWhileOfferingIsDiscarded) {
    coordinator.handlePeerJoined("b2");
    engine.calls.clear();

    coordinator.handleEnvelope(offerFrom("b2", "a1"));
    EXPECT_EQ(coordinator.linkState("b2"), NegotiationState::OfferSent);
    EXPECT_TRUE(engine.calls.isEmpty());
    EXPECT_EQ(out.count(RelayEnvelope::Type::Answer), 0);
}

TEST_F(NegotiationCoordinatorTest, OfferAfterConnectedIsDiscarded) {
    coordinator.handleEnvelope(offerFrom("0host", "a1"));
    coordinator.handleEnvelope(offerFrom("0host", "a1"));
    EXPECT_EQ(out.count(RelayEnvelope::Type::Answer), 1);
    EXPECT_EQ(engine.calls.count("open:0host"), 1);
}

TEST_F(NegotiationCoordinatorTest, StrayAnswersAreIgnored) {
    coordinator.handleEnvelope(answerFrom("b2", "a1"));
    EXPECT_FALSE(coordinator.hasLink("b2"));

    coordinator.handleEnvelope(offerFrom("0host", "a1"));
    engine.calls.clear();
    coordinator.handleEnvelope(answerFrom("0host", "a1"));
    EXPECT_EQ(coordinator.linkState("0host"), NegotiationState::Connected);
    EXPECT_TRUE(engine.calls.isEmpty());
}

TEST_F(NegotiationCoordinatorTest, SignalsForSomeoneElseAreIgnored) {
    coordinator.handleEnvelope(offerFrom("0host", "c3"));
    EXPECT_FALSE(coordinator.hasLink("0host"));
    EXPECT_TRUE(engine.calls.isEmpty());
}

TEST_F(NegotiationCoordinatorTest, EndOfCandidatesIsNotAnError) {
    coordinator.handlePeerJoined("b2");

    coordinator.handleEnvelope(RelayEnvelope::ice("b2", "a1", QJsonValue(QJsonValue::Null)));
    coordinator.handleEnvelope(RelayEnvelope::ice("b2", "a1", QJsonObject()));
    EXPECT_TRUE(engine.candidates.value("b2").isEmpty());
    EXPECT_TRUE(coordinator.hasLink("b2"));
    EXPECT_TRUE(out.failed.isEmpty());

    coordinator.handleEnvelope(RelayEnvelope::ice("b2", "a1", QJsonObject{{"candidate", "c1"}}));
    ASSERT_EQ(engine.candidates.value("b2").size(), 1);
    EXPECT_EQ(engine.candidates.value("b2")[0]["candidate"].toString(), "c1");
}

TEST_F(NegotiationCoordinatorTest, CandidateForUnknownPeerIsDropped) {
    coordinator.handleEnvelope(RelayEnvelope::ice("zz", "a1", QJsonObject{{"candidate", "c1"}}));
    EXPECT_TRUE(engine.candidates.isEmpty());
    EXPECT_FALSE(coordinator.hasLink("zz"));
}

TEST_F(NegotiationCoordinatorTest, GatheredCandidatesAreForwarded) {
    coordinator.handlePeerJoined("b2");
    engine.emitCandidate("b2", QJsonObject{{"candidate", "local-c1"}});
    engine.emitCandidate("b2", QJsonObject());
    engine.emitCandidate("nobody", QJsonObject{{"candidate", "x"}});

    ASSERT_EQ(out.count(RelayEnvelope::Type::Ice), 1);
    EXPECT_EQ(out.sent.last().to, "b2");
    EXPECT_EQ(out.sent.last().payload.toObject()["candidate"].toString(), "local-c1");
}

TEST_F(NegotiationCoordinatorTest, DisconnectedIsTransientFailedIsTerminal) {
    coordinator.handlePeerJoined("b2");
    coordinator.handleEnvelope(answerFrom("b2", "a1"));

    engine.emitState("b2", MediaConnectionState::Disconnected);
    EXPECT_TRUE(coordinator.hasLink("b2"));
    EXPECT_EQ(coordinator.linkState("b2"), NegotiationState::Connected);

    engine.emitState("b2", MediaConnectionState::Connected);
    engine.emitState("b2", MediaConnectionState::Failed);
    EXPECT_FALSE(coordinator.hasLink("b2"));
    EXPECT_FALSE(engine.openConnections.contains("b2"));
    EXPECT_EQ(out.removed, QStringList({"b2"}));
    EXPECT_EQ(engine.closeCount, 1);
}

TEST_F(NegotiationCoordinatorTest, EngineErrorAbortsOnlyThatLink) {
    engine.failOfferFor.insert("c3");
    coordinator.handleWelcome({{"b2", "Bob"}, {"c3", "Carol"}});

    EXPECT_TRUE(coordinator.hasLink("b2"));
    EXPECT_FALSE(coordinator.hasLink("c3"));
    EXPECT_EQ(out.failed, QStringList({"c3"}));
    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer, "b2"), 1);
    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer, "c3"), 0);

    // A later notice retries from scratch.
    engine.failOfferFor.clear();
    coordinator.handlePeerJoined("c3");
    EXPECT_EQ(coordinator.linkState("c3"), NegotiationState::OfferSent);
}

TEST_F(NegotiationCoordinatorTest, AnswerFailureIsReported) {
    engine.failAnswerFor.insert("0host");
    coordinator.handleEnvelope(offerFrom("0host", "a1"));
    EXPECT_FALSE(coordinator.hasLink("0host"));
    EXPECT_EQ(out.failed, QStringList({"0host"}));
    EXPECT_EQ(out.count(RelayEnvelope::Type::Answer), 0);
}

TEST_F(NegotiationCoordinatorTest, RefusedConnectionCreatesNoLink) {
    engine.refuseOpenFor.insert("b2");
    coordinator.handlePeerJoined("b2");
    EXPECT_FALSE(coordinator.hasLink("b2"));
    EXPECT_EQ(out.failed, QStringList({"b2"}));
}

TEST_F(NegotiationCoordinatorTest, LateOfferCompletionForRemovedLinkIsDropped) {
    engine.deferOffers = true;
    coordinator.handlePeerJoined("b2");
    coordinator.removePeer("b2");
    coordinator.handlePeerJoined("b2");
    engine.releaseOffers();

    EXPECT_EQ(out.count(RelayEnvelope::Type::Offer, "b2"), 1);
    EXPECT_EQ(coordinator.linkCount(), 1);
    EXPECT_EQ(coordinator.linkState("b2"), NegotiationState::OfferSent);
}

TEST_F(NegotiationCoordinatorTest, PeerLeftAndEndReleaseMedia) {
    bool ended = false;
    QObject::connect(&coordinator, &NegotiationCoordinator::meetingEnded, [&] { ended = true; });

    coordinator.handleWelcome({{"b2", "Bob"}, {"c3", "Carol"}, {"d4", "Dan"}});
    ASSERT_EQ(coordinator.linkCount(), 3);

    coordinator.handleEnvelope(RelayEnvelope::peerLeft("c3"));
    EXPECT_FALSE(coordinator.hasLink("c3"));
    EXPECT_FALSE(engine.openConnections.contains("c3"));

    // Anything arriving later for the closed link finds no record.
    coordinator.handleEnvelope(answerFrom("c3", "a1"));
    EXPECT_FALSE(coordinator.hasLink("c3"));

    coordinator.handleEnvelope(RelayEnvelope::end());
    EXPECT_TRUE(ended);
    EXPECT_EQ(coordinator.linkCount(), 0);
    EXPECT_TRUE(engine.openConnections.isEmpty());
    EXPECT_EQ(out.removed.size(), 3);
}

TEST_F(NegotiationCoordinatorTest, FrameCryptorAttachedWhenEngineSupportsIt) {
    ChannelCrypto crypto("room-x");
    ASSERT_TRUE(crypto.deriveKey());
    coordinator.setFrameCrypto(&crypto);

    coordinator.handlePeerJoined("b2");
    EXPECT_FALSE(engine.frameTransforms.contains("b2"));
    EXPECT_TRUE(coordinator.hasLink("b2"));

    engine.supportsFrameTransform = true;
    coordinator.handlePeerJoined("c3");
    ASSERT_TRUE(engine.frameTransforms.contains("c3"));

    QByteArray sealed;
    QByteArray plain;
    ASSERT_TRUE(engine.frameTransforms.value("c3")->encryptFrame("frame", &sealed));
    ASSERT_TRUE(engine.frameTransforms.value("c3")->decryptFrame(sealed, &plain));
    EXPECT_EQ(plain, QByteArray("frame"));
}

TEST_F(NegotiationCoordinatorTest, RemoteMediaIsReportedForKnownLinksOnly) {
    QStringList ready;
    QObject::connect(&coordinator, &NegotiationCoordinator::remoteMediaReady,
                     [&](const QString& peer) { ready.append(peer); });

    coordinator.handlePeerJoined("b2");
    emit engine.remoteMediaReady("b2");
    emit engine.remoteMediaReady("nobody");
    EXPECT_EQ(ready, QStringList({"b2"}));
}

// Three instances wired through an in-memory relay.
class MeshScenarioTest : public ::testing::Test {
protected:
    struct Node {
        QString id;
        QScopedPointer<FakeMediaEngine> engine;
        QScopedPointer<NegotiationCoordinator> coordinator;
    };

    void addNode(const QString& id) {
        Node* node = new Node;
        node->id = id;
        node->engine.reset(new FakeMediaEngine(id));
        node->coordinator.reset(new NegotiationCoordinator(id, node->engine.data()));
        QObject::connect(node->coordinator.data(), &NegotiationCoordinator::envelopeReady,
                         [this](const RelayEnvelope& env) { route(env); });
        nodes.insert(id, node);
    }

    void route(const RelayEnvelope& env) {
        traffic.append(env);
        Node* target = nodes.value(env.to);
        if (target) target->coordinator->handleEnvelope(env);
    }

    // Mirrors the relay: welcome lists earlier members, then others hear peer-joined.
    void join(const QString& id) {
        addNode(id);
        QList<ParticipantInfo> others;
        for (const QString& member : members) others.append({member, member});
        nodes.value(id)->coordinator->handleEnvelope(RelayEnvelope::welcome(id, others));
        for (const QString& member : members) {
            nodes.value(member)->coordinator->handleEnvelope(RelayEnvelope::peerJoined(id, id));
        }
        members.append(id);
    }

    int offers(const QString& from, const QString& to) const {
        int n = 0;
        for (const RelayEnvelope& env : traffic) {
            if (env.type == RelayEnvelope::Type::Offer && env.from == from && env.to == to) ++n;
        }
        return n;
    }

    void TearDown() override {
        qDeleteAll(nodes);
    }

    QMap<QString, Node*> nodes;
    QStringList members;
    QList<RelayEnvelope> traffic;
};

TEST_F(MeshScenarioTest, LowestIdHostOffersToEveryone) {
    join("0host");
    join("a1");
    join("b2");

    EXPECT_EQ(offers("0host", "a1"), 1);
    EXPECT_EQ(offers("0host", "b2"), 1);
    EXPECT_EQ(offers("a1", "b2"), 1);
    EXPECT_EQ(offers("a1", "0host"), 0);
    EXPECT_EQ(offers("b2", "0host"), 0);
    EXPECT_EQ(offers("b2", "a1"), 0);

    for (Node* node : nodes) {
        EXPECT_EQ(node->coordinator->linkCount(), 2) << node->id.toStdString();
        for (const QString& peer : node->coordinator->linkedPeers()) {
            EXPECT_EQ(node->coordinator->linkState(peer), NegotiationState::Connected)
                << node->id.toStdString() << " -> " << peer.toStdString();
        }
    }
}

TEST_F(MeshScenarioTest, JoinOrderDoesNotChangeWhoOffers) {
    join("b2");
    join("a1");
    join("0host");

    EXPECT_EQ(offers("0host", "a1"), 1);
    EXPECT_EQ(offers("0host", "b2"), 1);
    EXPECT_EQ(offers("a1", "b2"), 1);
    EXPECT_EQ(traffic.size() - offers("0host", "a1") - offers("0host", "b2") - offers("a1", "b2"), 3);
}
