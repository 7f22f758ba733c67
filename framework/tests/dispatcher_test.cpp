#include <gtest/gtest.h>
#include "framework/dispatch/exchange_dispatcher.hpp"
#include "framework/exception/errors.hpp"
#include "test_plugins.hpp"

#include <boost/json.hpp>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>

using namespace plugrt::framework;
using plugrt::framework::test_support::ScriptedPlugin;
using plugrt::framework::test_support::eventually;
using plugrt::framework::test_support::pass_through;
using plugrt::framework::test_support::sleeping;
using plugrt::framework::test_support::throwing;
using namespace std::chrono_literals;

class DispatcherTest : public ::testing::Test
{
protected:
  IoContextPool pool{4};

  std::unique_ptr<ExchangeDispatcher> make_dispatcher(std::shared_ptr<Plugin> plugin,
                                                      std::chrono::milliseconds timeout = 1000ms)
  {
    return std::make_unique<ExchangeDispatcher>(std::move(plugin), pool, timeout);
  }

  static void expect_synthesized_500(const Decision& decision, const std::string& plugin_name)
  {
    EXPECT_FALSE(decision.continues());
    ASSERT_EQ(decision.short_circuit_status().value_or(0), 500);
    EXPECT_EQ(decision.short_circuit_headers().get("content-type").value_or(""), "application/json");

    auto body = boost::json::parse(decision.short_circuit_body()).as_object();
    EXPECT_EQ(body.at("plugin").as_string(), plugin_name);
    EXPECT_FALSE(body.at("error").as_string().empty());
  }
};

// --- Configuration ---

TEST_F(DispatcherTest, DeclaredStageWithoutHandlerIsConfigurationError)
{
  auto plugin = ScriptedPlugin::create("lonely", Stage::Request);
  EXPECT_THROW(make_dispatcher(plugin), ConfigurationError);
}

TEST_F(DispatcherTest, EmptyStageSetIsConfigurationError)
{
  auto plugin = std::make_shared<ScriptedPlugin>(CapabilityDescriptor("idle", "1.0.0"));
  EXPECT_THROW(make_dispatcher(plugin), ConfigurationError);
}

TEST_F(DispatcherTest, DescribeFailureIsConfigurationError)
{
  class BrokenPlugin : public BasePlugin<BrokenPlugin>
  {
  public:
    CapabilityDescriptor describe() const override { throw std::runtime_error("no descriptor today"); }
    void register_handlers(StageRouter&) override {}
  };
  EXPECT_THROW(make_dispatcher(std::make_shared<BrokenPlugin>()), ConfigurationError);
}

TEST_F(DispatcherTest, NullPluginIsConfigurationError)
{
  EXPECT_THROW(make_dispatcher(nullptr), ConfigurationError);
}

TEST_F(DispatcherTest, ExtraHandlerIsAccepted)
{
  auto plugin = ScriptedPlugin::create("extra", Stage::Request);
  plugin->on(Stage::Request, pass_through()).on(Stage::Response, pass_through());
  auto dispatcher = make_dispatcher(plugin);
  EXPECT_FALSE(dispatcher->descriptor().supports(Stage::Response));
}

// --- Happy paths ---

TEST_F(DispatcherTest, PassThroughContinues)
{
  auto plugin = ScriptedPlugin::create("noop", Stage::Request);
  plugin->on(Stage::Request, pass_through());
  auto dispatcher = make_dispatcher(plugin);

  auto decision = dispatcher->exchange(Envelope::request("GET", "/health"));
  EXPECT_TRUE(decision.continues());
  EXPECT_FALSE(decision.is_mutation());
}

TEST_F(DispatcherTest, AuthorizationScenario)
{
  auto plugin = ScriptedPlugin::create("auth", Stage::Request);
  plugin->on(Stage::Request, [](const Envelope& envelope, CallContext&)
  {
    if (envelope.get_header("authorization") != std::optional<std::string>("Bearer secret"))
    {
      return Decision::short_circuit(401, R"({"error":"unauthorized"})",
                                     HeaderMap{{"Content-Type", "application/json"}});
    }
    return Decision::pass();
  });
  auto dispatcher = make_dispatcher(plugin);

  auto denied = dispatcher->exchange(Envelope::request("GET", "/api/users"));
  EXPECT_FALSE(denied.continues());
  EXPECT_EQ(denied.short_circuit_status().value_or(0), 401);
  EXPECT_EQ(denied.short_circuit_body(), R"({"error":"unauthorized"})");

  auto request = Envelope::request("GET", "/api/users");
  request.headers.add("Authorization", "Bearer secret");
  auto allowed = dispatcher->exchange(request);
  EXPECT_TRUE(allowed.continues());
  EXPECT_FALSE(allowed.is_mutation());
}

TEST_F(DispatcherTest, HeaderInjectionScenario)
{
  auto plugin = ScriptedPlugin::create("tagger", Stage::Request);
  plugin->on(Stage::Request, [](const Envelope& envelope, CallContext&)
  {
    Envelope mutated = envelope;
    mutated.headers.add("X-Plugin", "tagger");
    return Decision::mutate(std::move(mutated));
  });
  auto dispatcher = make_dispatcher(plugin);

  auto request = Envelope::request("POST", "/items");
  request.headers.add("Accept", "*/*");
  request.body = "payload";
  request.metadata["trace-id"] = "abc";

  auto decision = dispatcher->exchange(request);
  ASSERT_TRUE(decision.is_mutation());
  const auto& mutated = *decision.mutated_envelope();
  EXPECT_EQ(mutated.get_header("x-plugin").value_or(""), "tagger");

  Envelope expected = request;
  expected.headers.add("X-Plugin", "tagger");
  EXPECT_EQ(mutated, expected);
}

TEST_F(DispatcherTest, RepeatedExchangeGivesSameDecision)
{
  auto plugin = ScriptedPlugin::create("pure", Stage::Response);
  plugin->on(Stage::Response, [](const Envelope& envelope, CallContext&)
  {
    Envelope mutated = envelope;
    mutated.headers.set("X-Seen-Status", std::to_string(envelope.status_code.value_or(0)));
    return Decision::mutate(std::move(mutated));
  });
  auto dispatcher = make_dispatcher(plugin);

  auto response = Envelope::response(201);
  response.headers.add("Location", "/items/1");
  EXPECT_EQ(dispatcher->exchange(response), dispatcher->exchange(response));
}

TEST_F(DispatcherTest, HandlerSeesPeerAndDeadline)
{
  auto seen_peer = std::make_shared<std::string>();
  auto seen_remaining = std::make_shared<std::chrono::milliseconds>(0);
  auto plugin = ScriptedPlugin::create("ctx", Stage::Request);
  plugin->on(Stage::Request, [seen_peer, seen_remaining](const Envelope&, CallContext& ctx)
  {
    *seen_peer = ctx.peer();
    *seen_remaining = ctx.remaining();
    return Decision::pass();
  });
  auto dispatcher = make_dispatcher(plugin, 2000ms);

  dispatcher->exchange(Envelope::request("GET", "/"), "ipv4:127.0.0.1:5555");
  EXPECT_EQ(*seen_peer, "ipv4:127.0.0.1:5555");
  EXPECT_GT(seen_remaining->count(), 0);
  EXPECT_LE(seen_remaining->count(), 2000);
}

// --- Validation ---

TEST_F(DispatcherTest, UndeclaredStageIsProtocolError)
{
  auto plugin = ScriptedPlugin::create("request-only", Stage::Request);
  plugin->on(Stage::Request, pass_through());
  auto dispatcher = make_dispatcher(plugin);

  EXPECT_THROW(dispatcher->exchange(Envelope::response(200)), ProtocolError);
}

TEST_F(DispatcherTest, InvalidEnvelopeNeverReachesHandler)
{
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto plugin = ScriptedPlugin::create("response", Stage::Response);
  plugin->on(Stage::Response, [calls](const Envelope&, CallContext&)
  {
    ++*calls;
    return Decision::pass();
  });
  auto dispatcher = make_dispatcher(plugin);

  Envelope missing_status;
  missing_status.stage = Stage::Response;
  EXPECT_THROW(dispatcher->exchange(missing_status), ProtocolError);
  EXPECT_EQ(calls->load(), 0);
}

TEST_F(DispatcherTest, InvalidHandlerDecisionFollowsPolicy)
{
  auto plugin = ScriptedPlugin::create("confused", Stage::Request);
  plugin->on(Stage::Request, [](const Envelope&, CallContext&)
  {
    return Decision::mutate(Envelope::response(200));
  });
  auto dispatcher = make_dispatcher(plugin);

  expect_synthesized_500(dispatcher->exchange(Envelope::request("GET", "/")), "confused");
}

// --- Failures ---

TEST_F(DispatcherTest, ThrowingHandlerFailClosed)
{
  auto plugin = ScriptedPlugin::create("fragile", Stage::Request, FailurePolicy::FailClosed);
  plugin->on(Stage::Request, throwing("database unavailable"));
  auto dispatcher = make_dispatcher(plugin);

  auto decision = dispatcher->exchange(Envelope::request("GET", "/"));
  expect_synthesized_500(decision, "fragile");
  // internal details stay inside the plugin
  EXPECT_EQ(decision.short_circuit_body().find("database unavailable"), std::string::npos);
}

TEST_F(DispatcherTest, ThrowingHandlerFailOpen)
{
  auto plugin = ScriptedPlugin::create("optional", Stage::Request, FailurePolicy::FailOpen);
  plugin->on(Stage::Request, throwing("boom"));
  auto dispatcher = make_dispatcher(plugin);

  auto decision = dispatcher->exchange(Envelope::request("GET", "/"));
  EXPECT_TRUE(decision.continues());
  EXPECT_FALSE(decision.is_mutation());
}

TEST_F(DispatcherTest, TimeoutFailClosed)
{
  auto plugin = ScriptedPlugin::create("slow", Stage::Request, FailurePolicy::FailClosed);
  plugin->on(Stage::Request, sleeping(500ms));
  auto dispatcher = make_dispatcher(plugin, 100ms);

  const auto start = std::chrono::steady_clock::now();
  auto decision = dispatcher->exchange(Envelope::request("GET", "/"));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  expect_synthesized_500(decision, "slow");
  EXPECT_GE(elapsed, 100ms);
  EXPECT_LT(elapsed, 400ms);
}

TEST_F(DispatcherTest, TimeoutFailOpen)
{
  auto plugin = ScriptedPlugin::create("slow-open", Stage::Response, FailurePolicy::FailOpen);
  plugin->on(Stage::Response, sleeping(500ms));
  auto dispatcher = make_dispatcher(plugin, 100ms);

  const auto start = std::chrono::steady_clock::now();
  auto decision = dispatcher->exchange(Envelope::response(200));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(decision.continues());
  EXPECT_FALSE(decision.is_mutation());
  EXPECT_LT(elapsed, 400ms);
}

TEST_F(DispatcherTest, TimedOutHandlerIsCancelled)
{
  auto observed = std::make_shared<std::atomic<bool>>(false);
  auto plugin = ScriptedPlugin::create("cooperative", Stage::Request);
  plugin->on(Stage::Request, [observed](const Envelope&, CallContext& ctx)
  {
    while (!ctx.is_cancelled())
    {
      std::this_thread::sleep_for(1ms);
    }
    observed->store(true);
    return Decision::pass();
  });
  auto dispatcher = make_dispatcher(plugin, 50ms);

  dispatcher->exchange(Envelope::request("GET", "/"));
  EXPECT_TRUE(eventually([&]() { return observed->load(); }));
}

TEST_F(DispatcherTest, EarlierHostDeadlineWins)
{
  auto plugin = ScriptedPlugin::create("slow", Stage::Request);
  plugin->on(Stage::Request, sleeping(1000ms));
  auto dispatcher = make_dispatcher(plugin, 5000ms);

  const auto start = std::chrono::steady_clock::now();
  auto decision = dispatcher->exchange(Envelope::request("GET", "/"), "host", start + 100ms);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 600ms);
  EXPECT_EQ(decision.short_circuit_status().value_or(0), 500);
}

TEST_F(DispatcherTest, HostCancellationAbandonsCall)
{
  auto observed = std::make_shared<std::atomic<bool>>(false);
  auto plugin = ScriptedPlugin::create("abandoned", Stage::Request);
  plugin->on(Stage::Request, [observed](const Envelope&, CallContext& ctx)
  {
    while (!ctx.is_cancelled())
    {
      std::this_thread::sleep_for(1ms);
    }
    observed->store(true);
    return Decision::short_circuit(418);
  });
  auto dispatcher = make_dispatcher(plugin, 5000ms);

  const auto cancel_at = std::chrono::steady_clock::now() + 50ms;
  EXPECT_THROW(dispatcher->exchange(Envelope::request("GET", "/"), "host", ExchangeDispatcher::Clock::time_point::max(),
                 [cancel_at]() { return std::chrono::steady_clock::now() >= cancel_at; }),
               CallCancelled);
  EXPECT_TRUE(eventually([&]() { return observed->load(); }));
}

// --- Exception handlers ---

TEST_F(DispatcherTest, ExceptionDispatcherMapsByType)
{
  auto mapper = std::make_shared<ExceptionDispatcher>();
  mapper->on<std::invalid_argument>([](const std::invalid_argument& e, const Envelope&)
  {
    return Decision::short_circuit(400, e.what());
  });

  auto plugin = ScriptedPlugin::create("validator", Stage::Request);
  plugin->on(Stage::Request, [](const Envelope& envelope, CallContext&) -> Decision
  {
    if (envelope.body.empty())
    {
      throw std::invalid_argument("body required");
    }
    throw std::logic_error("unexpected");
  });
  plugin->map_exceptions(mapper);
  auto dispatcher = make_dispatcher(plugin);

  auto mapped = dispatcher->exchange(Envelope::request("POST", "/"));
  EXPECT_EQ(mapped.short_circuit_status().value_or(0), 400);
  EXPECT_EQ(mapped.short_circuit_body(), "body required");

  // unmapped exceptions still get the failure policy
  auto request = Envelope::request("POST", "/");
  request.body = "x";
  expect_synthesized_500(dispatcher->exchange(request), "validator");
}

TEST_F(DispatcherTest, ExceptionHandlerSeesTimeout)
{
  class GatewayTimeout : public ExceptionHandler<TimeoutError>
  {
  public:
    Decision handle(const TimeoutError&, const Envelope& envelope) override
    {
      return Decision::short_circuit(504, "upstream plugin timed out for " + envelope.url.value_or(""));
    }
  };

  auto plugin = ScriptedPlugin::create("slow", Stage::Request);
  plugin->on(Stage::Request, sleeping(500ms));
  plugin->map_exceptions(std::make_shared<GatewayTimeout>());
  auto dispatcher = make_dispatcher(plugin, 50ms);

  auto decision = dispatcher->exchange(Envelope::request("GET", "/slow"));
  EXPECT_EQ(decision.short_circuit_status().value_or(0), 504);
  EXPECT_EQ(decision.short_circuit_body(), "upstream plugin timed out for /slow");
}

TEST_F(DispatcherTest, UnmappedExceptionIsOfferedAsHandlerError)
{
  auto mapper = std::make_shared<ExceptionDispatcher>();
  mapper->on<HandlerError>([](const HandlerError& e, const Envelope&)
  {
    std::string cause;
    try
    {
      std::rethrow_if_nested(e);
    }
    catch (const std::exception& inner)
    {
      cause = inner.what();
    }
    catch (int code)
    {
      cause = "code " + std::to_string(code);
    }
    return Decision::short_circuit(503, cause);
  });

  auto plugin = ScriptedPlugin::create("storage", Stage::Request);
  plugin->on(Stage::Request, [](const Envelope& envelope, CallContext&) -> Decision
  {
    if (envelope.body.empty())
    {
      throw std::logic_error("disk full");
    }
    throw 42;
  });
  plugin->map_exceptions(mapper);
  auto dispatcher = make_dispatcher(plugin);

  // the original exception stays reachable through the wrapper
  auto wrapped = dispatcher->exchange(Envelope::request("PUT", "/blob"));
  EXPECT_EQ(wrapped.short_circuit_status().value_or(0), 503);
  EXPECT_EQ(wrapped.short_circuit_body(), "disk full");

  auto request = Envelope::request("PUT", "/blob");
  request.body = "x";
  auto non_standard = dispatcher->exchange(request);
  EXPECT_EQ(non_standard.short_circuit_status().value_or(0), 503);
  EXPECT_EQ(non_standard.short_circuit_body(), "code 42");
}

TEST_F(DispatcherTest, HandlerErrorReachesMapperAsThrown)
{
  auto mapper = std::make_shared<ExceptionDispatcher>();
  mapper->on<HandlerError>([](const HandlerError& e, const Envelope&)
  {
    const bool nested = dynamic_cast<const std::nested_exception*>(&e) != nullptr;
    return Decision::short_circuit(503, nested ? "wrapped" : e.what());
  });

  auto plugin = ScriptedPlugin::create("quota", Stage::Request);
  plugin->on(Stage::Request, throwing("quota exhausted"));
  plugin->map_exceptions(mapper);
  auto dispatcher = make_dispatcher(plugin);

  auto decision = dispatcher->exchange(Envelope::request("GET", "/"));
  EXPECT_EQ(decision.short_circuit_body(), "quota exhausted");
}

TEST_F(DispatcherTest, NonStandardThrowFromExceptionHandlerFallsBackToPolicy)
{
  auto mapper = std::make_shared<ExceptionDispatcher>();
  mapper->on<std::runtime_error>([](const std::runtime_error&, const Envelope&) -> Decision
  {
    throw 7;
  });

  auto closed = ScriptedPlugin::create("broken-mapper", Stage::Request);
  closed->on(Stage::Request, [](const Envelope&, CallContext&) -> Decision
  {
    throw std::runtime_error("backend down");
  });
  closed->map_exceptions(mapper);
  auto dispatcher = make_dispatcher(closed);

  Decision decision = Decision::pass();
  EXPECT_NO_THROW(decision = dispatcher->exchange(Envelope::request("GET", "/")));
  expect_synthesized_500(decision, "broken-mapper");

  auto open = ScriptedPlugin::create("broken-mapper", Stage::Response, FailurePolicy::FailOpen);
  open->on(Stage::Response, [](const Envelope&, CallContext&) -> Decision
  {
    throw std::runtime_error("backend down");
  });
  open->map_exceptions(mapper);
  auto open_dispatcher = make_dispatcher(open);

  Decision passed = Decision::short_circuit(418);
  EXPECT_NO_THROW(passed = open_dispatcher->exchange(Envelope::response(200)));
  EXPECT_EQ(passed, Decision::pass());
}

// --- Concurrency ---

TEST_F(DispatcherTest, ConcurrentCallsAreIndependent)
{
  auto plugin = ScriptedPlugin::create("echo", Stage::Request);
  plugin->on(Stage::Request, [](const Envelope& envelope, CallContext&)
  {
    std::this_thread::sleep_for(100ms);
    Envelope mutated = envelope;
    mutated.headers.set("X-Echo", envelope.url.value_or(""));
    return Decision::mutate(std::move(mutated));
  });
  auto dispatcher = make_dispatcher(plugin, 5000ms);

  constexpr int calls = 8;
  std::vector<std::future<Decision>> results;
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < calls; ++i)
  {
    results.push_back(std::async(std::launch::async, [&dispatcher, i]()
    {
      return dispatcher->exchange(Envelope::request("GET", "/item/" + std::to_string(i)));
    }));
  }

  for (int i = 0; i < calls; ++i)
  {
    Decision decision = results[i].get();
    ASSERT_TRUE(decision.is_mutation());
    EXPECT_EQ(decision.mutated_envelope()->get_header("X-Echo").value_or(""), "/item/" + std::to_string(i));
  }
  // 4 workers, 8 calls of 100ms: two rounds, far below the serial 800ms
  EXPECT_LT(std::chrono::steady_clock::now() - start, 700ms);
}
