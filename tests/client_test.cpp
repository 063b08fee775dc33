// tests/client_test.cpp
// Client dispatch, identity, enrichment, lifecycle and concurrency tests.

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pulse {
namespace {

using test::ErrorLog;
using test::RecordingPipeline;

class ClientTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingPipeline> pipeline = std::make_shared<RecordingPipeline>();
    ErrorLog errors;
    std::unique_ptr<Pulse> client = test::make_client(pipeline, errors);

    template <typename E>
    E last() const {
        return std::get<E>(pipeline->last());
    }
};

Properties checkout_properties() {
    return Properties{
        {"sku", std::string("sku-1")},
        {"quantity", 2},
        {"price", 9.5},
    };
}

// Client on the default worker, pointed at a port nobody listens on.
std::unique_ptr<Pulse> make_worker_client() {
    auto config = PulseConfig::builder(test::TEST_API_KEY)
        .endpoint("localhost:19999")
        .batch_size(10)
        .flush_interval(std::chrono::milliseconds(100))
        .close_timeout(std::chrono::milliseconds(2000))
        .network_timeout(std::chrono::milliseconds(500))
        .max_retries(0)
        .on_error([](const PulseError&, bool) {})
        .build();
    return Pulse::create(std::move(config));
}

// ==================== Track ====================

TEST_F(ClientTest, TrackWithoutProperties) {
    client->track("Signed Up");

    ASSERT_EQ(pipeline->size(), 1u);
    auto e = last<TrackEvent>();
    EXPECT_EQ(e.event(), "Signed Up");
    EXPECT_FALSE(e.properties().has_value());
    EXPECT_EQ(errors.size(), 0u);
}

TEST_F(ClientTest, TypedAndUntypedProduceSamePayload) {
    client->track("Checkout", shop::Checkout{"sku-1", 2, 9.5});
    client->track("Checkout", checkout_properties());

    auto events = pipeline->events();
    ASSERT_EQ(events.size(), 2u);
    const auto& typed = std::get<TrackEvent>(events[0]);
    const auto& untyped = std::get<TrackEvent>(events[1]);
    ASSERT_TRUE(typed.properties().has_value());
    EXPECT_EQ(*typed.properties(), *untyped.properties());
}

TEST_F(ClientTest, EmptyOptionalsAreAbsent) {
    client->track("a", std::optional<shop::Checkout>());
    client->track("b", std::optional<Properties>());
    client->track("c", std::nullopt);

    auto events = pipeline->events();
    ASSERT_EQ(events.size(), 3u);
    for (const auto& e : events) {
        EXPECT_FALSE(std::get<TrackEvent>(e).properties().has_value());
    }
    EXPECT_EQ(errors.size(), 0u);
}

TEST_F(ClientTest, PresentTypedOptionalIsSerialized) {
    client->track("a", std::optional<shop::Checkout>(shop::Checkout{"s", 1, 1.0}));
    EXPECT_EQ(last<TrackEvent>().properties()->find("sku")->as_string(), "s");
}

TEST_F(ClientTest, EmptyPropertiesIsEmptyObject) {
    client->track("a", Properties{});
    ASSERT_TRUE(last<TrackEvent>().properties().has_value());
    EXPECT_EQ(last<TrackEvent>().properties()->size(), 0u);
}

TEST_F(ClientTest, TypedFailureIsFatalAndSendsNothing) {
    client->track("Ratio", shop::Ratio{std::nan("")});

    EXPECT_EQ(pipeline->size(), 0u);
    auto entries = errors.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, ErrorKind::Serialization);
    EXPECT_TRUE(entries[0].fatal);
}

TEST_F(ClientTest, TypedNonObjectIsFatal) {
    client->track("Number", 5);

    EXPECT_EQ(pipeline->size(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors.entries()[0].fatal);
}

TEST_F(ClientTest, TypedWithoutConversionIsFatal) {
    client->track("Opaque", shop::Opaque{1});

    EXPECT_EQ(pipeline->size(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.entries()[0].kind, ErrorKind::Serialization);
}

TEST_F(ClientTest, UntypedFailureSendsWithoutPayload) {
    client->track("Opaque", Properties{{"handle", shop::Opaque{1}}, {"ok", true}});

    ASSERT_EQ(pipeline->size(), 1u);
    EXPECT_FALSE(last<TrackEvent>().properties().has_value());
    auto entries = errors.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, ErrorKind::Serialization);
    EXPECT_FALSE(entries[0].fatal);
    EXPECT_NE(entries[0].message.find("handle"), std::string::npos);
}

TEST_F(ClientTest, EmptyEventNameRejected) {
    client->track("");

    EXPECT_EQ(pipeline->size(), 0u);
    auto entries = errors.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, ErrorKind::InvalidEvent);
    EXPECT_FALSE(entries[0].fatal);
}

TEST_F(ClientTest, CallerMessageId) {
    client->track(MessageId{"order-42"}, "Order Completed");
    EXPECT_EQ(last<TrackEvent>().envelope().message_id, "order-42");

    client->track(MessageId{""}, "Order Completed");
    EXPECT_EQ(last<TrackEvent>().envelope().message_id.size(), 36u);
}

TEST_F(ClientTest, GeneratedEnvelope) {
    auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    client->track("a");
    client->track("b");

    auto events = pipeline->events();
    const Envelope& first = envelope_of(events[0]);
    const Envelope& second = envelope_of(events[1]);
    EXPECT_EQ(first.message_id.size(), 36u);
    EXPECT_EQ(first.message_id[14], '4');
    EXPECT_NE(first.message_id, second.message_id);
    EXPECT_GE(first.timestamp, static_cast<uint64_t>(before));
    EXPECT_EQ(first.anonymous_id, client->anonymous_id());
    EXPECT_FALSE(first.user_id.has_value());
}

// ==================== Identify ====================

TEST_F(ClientTest, IdentifyUserIdKeepsTraits) {
    client->identify(Properties{{"plan", std::string("pro")}});
    client->identify("u1");

    EXPECT_EQ(*client->user_id(), "u1");
    EXPECT_EQ(client->traits()->find("plan")->as_string(), "pro");

    auto e = last<IdentifyEvent>();
    EXPECT_EQ(*e.envelope().user_id, "u1");
    EXPECT_FALSE(e.traits().has_value());
}

TEST_F(ClientTest, IdentifyTraitsReplacesAndKeepsUserId) {
    client->identify("u1", Properties{{"a", 1}, {"b", 2}});
    client->identify(Properties{{"c", 3}});

    EXPECT_EQ(*client->user_id(), "u1");
    EXPECT_EQ(*client->traits(), Value::object({{"c", 3}}));

    auto e = last<IdentifyEvent>();
    EXPECT_FALSE(e.user_id().has_value());
    EXPECT_EQ(*e.envelope().user_id, "u1");
    EXPECT_EQ(*e.traits(), Value::object({{"c", 3}}));
}

TEST_F(ClientTest, IdentifyTypedTraits) {
    client->identify("u1", shop::Checkout{"sku", 1, 2.0});
    EXPECT_EQ(client->traits()->find("sku")->as_string(), "sku");

    client->identify(shop::Checkout{"other", 1, 2.0});
    EXPECT_EQ(client->traits()->find("sku")->as_string(), "other");
    EXPECT_EQ(*client->user_id(), "u1");
}

TEST_F(ClientTest, IdentifyAbsentTraitsKeepsStored) {
    client->identify("u1", Properties{{"a", 1}});
    client->identify("u2", std::optional<Properties>());

    EXPECT_EQ(*client->user_id(), "u2");
    EXPECT_EQ(*client->traits(), Value::object({{"a", 1}}));
}

TEST_F(ClientTest, IdentifyVersionBumps) {
    uint64_t v0 = client->identity().version;
    client->identify("u1", Properties{{"a", 1}});
    EXPECT_EQ(client->identity().version, v0 + 1);
}

TEST_F(ClientTest, IdentifyTypedFailureLeavesIdentity) {
    client->identify("u1");
    size_t sent = pipeline->size();

    client->identify("u2", shop::Ratio{INFINITY});

    EXPECT_EQ(*client->user_id(), "u1");
    EXPECT_EQ(pipeline->size(), sent);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors.entries()[0].fatal);
}

TEST_F(ClientTest, IdentifyUntypedTraitsFailureLeavesTraits) {
    client->identify(Properties{{"a", 1}});
    client->identify(Properties{{"bad", shop::Opaque{}}});

    EXPECT_EQ(*client->traits(), Value::object({{"a", 1}}));
    ASSERT_EQ(pipeline->size(), 2u);
    EXPECT_FALSE(last<IdentifyEvent>().traits().has_value());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_FALSE(errors.entries()[0].fatal);
}

TEST_F(ClientTest, IdentifyAtomicUnderConcurrency) {
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&] {
        for (int i = 0; i < 500; i++) {
            std::string id = "user-" + std::to_string(i);
            client->identify(id, Properties{{"owner", id}});
        }
        done = true;
    });
    std::thread reader([&] {
        while (!done) {
            IdentityState s = client->identity();
            if (s.user_id && s.traits->find("owner")->as_string() != *s.user_id) torn++;
        }
    });
    writer.join();
    reader.join();

    EXPECT_EQ(torn.load(), 0);
    for (const auto& e : pipeline->events()) {
        const auto& identify = std::get<IdentifyEvent>(e);
        EXPECT_EQ(identify.traits()->find("owner")->as_string(), *identify.envelope().user_id);
    }
}

// ==================== Screen / Group ====================

TEST_F(ClientTest, ScreenForms) {
    client->screen("Home");
    EXPECT_EQ(last<ScreenEvent>().title(), "Home");
    EXPECT_FALSE(last<ScreenEvent>().category().has_value());

    client->screen("Cart", std::string("Shop"), Properties{{"items", 3}});
    auto e = last<ScreenEvent>();
    EXPECT_EQ(*e.category(), "Shop");
    EXPECT_EQ(e.properties()->find("items")->as_int(), 3);

    client->screen("Cart", std::nullopt, shop::Checkout{"s", 1, 1.0});
    EXPECT_EQ(last<ScreenEvent>().properties()->find("sku")->as_string(), "s");
}

TEST_F(ClientTest, GroupForms) {
    client->group("org-1");
    EXPECT_EQ(last<GroupEvent>().group_id(), "org-1");
    EXPECT_FALSE(last<GroupEvent>().traits().has_value());

    client->group("org-1", Properties{{"seats", 10}});
    EXPECT_EQ(last<GroupEvent>().traits()->find("seats")->as_int(), 10);

    client->group("org-1", shop::Checkout{"s", 1, 1.0});
    EXPECT_EQ(last<GroupEvent>().traits()->find("sku")->as_string(), "s");
}

TEST_F(ClientTest, GroupEmptyIdRejected) {
    client->group("", Properties{{"seats", 10}});
    EXPECT_EQ(pipeline->size(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.entries()[0].kind, ErrorKind::InvalidEvent);
}

TEST_F(ClientTest, GroupRunsCallScopedEnrichments) {
    int calls = 0;
    Enrichments scoped{[&calls](Event e, Pulse&) -> std::optional<Event> {
        calls++;
        return e;
    }};
    client->group("org-1", Properties{{"seats", 1}}, scoped);
    client->group("org-1", scoped);
    EXPECT_EQ(calls, 2);
}

// ==================== Alias ====================

TEST_F(ClientTest, AliasFromAnonymous) {
    std::string anon = client->anonymous_id();
    client->alias("u1");

    auto e = last<AliasEvent>();
    EXPECT_EQ(e.user_id(), "u1");
    EXPECT_EQ(e.previous_id(), anon);
    EXPECT_EQ(*client->user_id(), "u1");
}

TEST_F(ClientTest, AliasReplacesUserId) {
    client->identify("u1", Properties{{"a", 1}});
    client->alias("u2");

    auto e = last<AliasEvent>();
    EXPECT_EQ(e.previous_id(), "u1");
    EXPECT_EQ(*e.envelope().user_id, "u2");
    EXPECT_EQ(*client->user_id(), "u2");
    EXPECT_EQ(*client->traits(), Value::object({{"a", 1}}));
}

TEST_F(ClientTest, AliasEmptyIdRejected) {
    client->identify("u1");
    client->alias("");
    EXPECT_EQ(*client->user_id(), "u1");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.entries()[0].kind, ErrorKind::InvalidEvent);
}

// ==================== Enrichments ====================

TEST_F(ClientTest, PipelineWideBeforeCallScoped) {
    std::vector<std::string> order;
    client->add([&order](Event e, Pulse&) -> std::optional<Event> {
        order.push_back("pipeline");
        return e;
    });
    Enrichments scoped{[&order](Event e, Pulse&) -> std::optional<Event> {
        order.push_back("call");
        return e;
    }};

    client->track("a", Properties{}, scoped);
    EXPECT_EQ(order, (std::vector<std::string>{"pipeline", "call"}));
}

TEST_F(ClientTest, ConfiguredEnrichmentsRun) {
    auto config = test::test_config(pipeline, errors)
        .enrichment([](Event e, Pulse&) -> std::optional<Event> {
            return std::get<TrackEvent>(e).with_properties(Value::object({{"enriched", true}}));
        })
        .build();
    auto enriched = Pulse::create(std::move(config));

    enriched->track("a");
    EXPECT_TRUE(last<TrackEvent>().properties()->find("enriched")->as_bool());
}

TEST_F(ClientTest, DroppingEnrichmentSendsNothing) {
    int later = 0;
    client->add([](Event, Pulse&) -> std::optional<Event> { return std::nullopt; });
    client->add([&later](Event e, Pulse&) -> std::optional<Event> {
        later++;
        return e;
    });

    client->identify("u1");
    client->track("a");

    EXPECT_EQ(pipeline->size(), 0u);
    EXPECT_EQ(later, 0);
    EXPECT_EQ(errors.size(), 0u);
    // The identity update is not undone by the drop.
    EXPECT_EQ(*client->user_id(), "u1");
}

TEST_F(ClientTest, ClearEnrichments) {
    client->add([](Event, Pulse&) -> std::optional<Event> { return std::nullopt; });
    client->clear_enrichments();
    client->track("a");
    EXPECT_EQ(pipeline->size(), 1u);
}

TEST_F(ClientTest, KindChangeReported) {
    client->add([](Event e, Pulse&) -> std::optional<Event> {
        return ScreenEvent(envelope_of(e), "Home");
    });
    client->track("a");

    EXPECT_EQ(pipeline->size(), 0u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.entries()[0].kind, ErrorKind::InvalidEvent);
}

TEST_F(ClientTest, EnrichmentReadsIdentity) {
    client->identify("u1");
    std::optional<std::string> seen;
    client->add([&seen](Event e, Pulse& c) -> std::optional<Event> {
        seen = c.user_id();
        return e;
    });
    client->track("a");
    EXPECT_EQ(*seen, "u1");
}

TEST_F(ClientTest, DispatchFromEnrichmentThrows) {
    client->add([](Event e, Pulse& c) -> std::optional<Event> {
        c.track("nested");
        return e;
    });
    EXPECT_THROW(client->track("outer"), std::logic_error);
    EXPECT_EQ(pipeline->size(), 0u);

    client->clear_enrichments();
    client->track("after");
    EXPECT_EQ(pipeline->size(), 1u);
}

TEST_F(ClientTest, EnrichmentMayDispatchToOtherClient) {
    auto other_pipeline = std::make_shared<RecordingPipeline>();
    ErrorLog other_errors;
    auto other = test::make_client(other_pipeline, other_errors);

    client->add([&other](Event e, Pulse&) -> std::optional<Event> {
        other->track("forwarded");
        return e;
    });
    EXPECT_NO_THROW(client->track("outer"));

    ASSERT_EQ(pipeline->size(), 1u);
    EXPECT_EQ(last<TrackEvent>().event(), "outer");
    ASSERT_EQ(other_pipeline->size(), 1u);
    EXPECT_EQ(std::get<TrackEvent>(other_pipeline->last()).event(), "forwarded");
    EXPECT_EQ(errors.size(), 0u);
    EXPECT_EQ(other_errors.size(), 0u);
}

// ==================== Identity / lifecycle ====================

TEST_F(ClientTest, RestoredAnonymousId) {
    auto restored = Pulse::create(test::test_config(pipeline, errors)
        .anonymous_id("anon-restored").build());
    EXPECT_EQ(restored->anonymous_id(), "anon-restored");
}

TEST_F(ClientTest, ResetIdentity) {
    std::string anon = client->anonymous_id();
    client->identify("u1", Properties{{"a", 1}});
    client->reset_identity();

    EXPECT_NE(client->anonymous_id(), anon);
    EXPECT_FALSE(client->user_id().has_value());
    EXPECT_FALSE(client->traits().has_value());

    client->track("a");
    EXPECT_EQ(last<TrackEvent>().envelope().anonymous_id, client->anonymous_id());
}

TEST_F(ClientTest, FlushAndCloseForwarded) {
    client->flush();
    client->close();
    client->close();
    EXPECT_EQ(pipeline->flushes(), 1);
    EXPECT_EQ(pipeline->closes(), 1);
}

TEST_F(ClientTest, DispatchAfterCloseReported) {
    client->close();
    client->track("a");
    client->identify("u1");

    EXPECT_EQ(pipeline->size(), 0u);
    EXPECT_FALSE(client->user_id().has_value());
    auto entries = errors.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].kind, ErrorKind::Closed);
    EXPECT_FALSE(entries[0].fatal);
}

TEST_F(ClientTest, ConcurrentDispatch) {
    constexpr int kThreads = 8;
    constexpr int kEventsPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kEventsPerThread; i++) {
                client->track("Event_" + std::to_string(t),
                              Properties{{"thread", t}, {"seq", i}});
            }
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_EQ(pipeline->size(), static_cast<size_t>(kThreads * kEventsPerThread));

    // Each thread's events arrive in the order that thread sent them.
    std::map<int64_t, int64_t> last_seq;
    for (const auto& event : pipeline->events()) {
        const auto& props = std::get<TrackEvent>(event).properties();
        ASSERT_TRUE(props.has_value());
        int64_t thread = props->find("thread")->as_int();
        int64_t seq = props->find("seq")->as_int();
        auto it = last_seq.find(thread);
        if (it != last_seq.end()) {
            EXPECT_GT(seq, it->second) << "thread " << thread;
        }
        last_seq[thread] = seq;
    }
    EXPECT_EQ(last_seq.size(), static_cast<size_t>(kThreads));
}

// ==================== Default worker ====================

TEST(ClientWorkerTest, CreateAndClose) {
    auto client = make_worker_client();
    client->close();
}

TEST(ClientWorkerTest, CreateAndDestroy) {
    auto client = make_worker_client();
}

TEST(ClientWorkerTest, AllMethodsComplete) {
    auto client = make_worker_client();
    client->track("Page Viewed", Properties{{"url", std::string("/home")}});
    client->identify("user_1", Properties{{"name", std::string("Jane")}});
    client->screen("Home");
    client->group("org_1", Properties{{"plan", std::string("pro")}});
    client->alias("user_2");
    client->flush();
    client->close();
}

TEST(ClientWorkerTest, ConcurrentTrack) {
    auto client = make_worker_client();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&client, t]() {
            for (int i = 0; i < 50; i++) {
                client->track("Event", Properties{{"thread", t}, {"seq", i}});
            }
        });
    }
    for (auto& t : threads) t.join();
    client->close();
}

TEST(ClientWorkerTest, CloseReturnsWithinTimeout) {
    auto client = make_worker_client();
    client->track("Event");

    auto start = std::chrono::steady_clock::now();
    client->close();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

} // namespace
} // namespace pulse
