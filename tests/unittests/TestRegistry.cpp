/*
 * Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
 * SPDX-License-Identifier: Apache-2.0
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <atomic>
#include <cstdint>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "src/core/common/TbExceptions.hpp"
#include "src/core/tracing/Context.hpp"
#include "src/core/tracing/Dispatch.hpp"
#include "src/core/tracing/Extensions.hpp"
#include "src/core/tracing/Layer.hpp"
#include "src/core/tracing/Macros.hpp"
#include "src/core/tracing/Registry.hpp"

using namespace tb::tracing;

namespace {

class LogLayer final : public Layer {
public:
  LogLayer(std::string name, std::vector<std::string> &log) : name_(std::move(name)), log_(log) {
  }

  void onNewSpan(Attributes const &attributes, SpanId const &id, Context const &ctx) override {
    static_cast<void>(id);
    static_cast<void>(ctx);
    log_.push_back(name_ + " new " + attributes.getMetadata().getName());
  }
  void onRecord(SpanId const &id, Record const &values, Context const &ctx) override {
    std::string entry{name_ + " record " + ctx.span(id)->getMetadata().getName()};
    for (FieldEntry const &field : values.getValues()) {
      entry.append(" ").append(field.name);
    }
    log_.push_back(entry);
  }
  void onEvent(Event const &event, Context const &ctx) override {
    std::optional<SpanRef> const current = ctx.lookupCurrent();
    log_.push_back(name_ + " event " + event.getValues().front().value.getString() + " in " +
                   (current.has_value() ? current->getMetadata().getName() : std::string{"none"}));
  }
  void onClose(SpanId const &id, Context const &ctx) override {
    // the span is still resolvable while layers are notified
    log_.push_back(name_ + " close " + ctx.span(id)->getMetadata().getName());
  }

private:
  std::string name_;
  std::vector<std::string> &log_;
};

class MockLayer : public Layer {
public:
  MOCK_METHOD(void, onNewSpan, (Attributes const &attributes, SpanId const &id, Context const &ctx), (override));
  MOCK_METHOD(void, onRecord, (SpanId const &id, Record const &values, Context const &ctx), (override));
  MOCK_METHOD(void, onEvent, (Event const &event, Context const &ctx), (override));
  MOCK_METHOD(void, onEnter, (SpanId const &id, Context const &ctx), (override));
  MOCK_METHOD(void, onExit, (SpanId const &id, Context const &ctx), (override));
  MOCK_METHOD(void, onClose, (SpanId const &id, Context const &ctx), (override));
};

class ThrowingLayer final : public Layer {
public:
  void onNewSpan(Attributes const &attributes, SpanId const &id, Context const &ctx) override {
    static_cast<void>(attributes);
    static_cast<void>(id);
    static_cast<void>(ctx);
    throw std::logic_error("rejected");
  }
};

class RejectingLogLayer final : public Layer {
public:
  explicit RejectingLogLayer(std::vector<std::string> &log) : log_(log) {
  }

  void onNewSpan(Attributes const &attributes, SpanId const &id, Context const &ctx) override {
    static_cast<void>(id);
    static_cast<void>(ctx);
    log_.push_back("rejecting new " + attributes.getMetadata().getName());
    throw std::logic_error("rejected");
  }
  void onClose(SpanId const &id, Context const &ctx) override {
    static_cast<void>(ctx);
    static_cast<void>(id);
    log_.push_back("rejecting close");
  }

private:
  std::vector<std::string> &log_;
};

} // namespace

struct TestRegistry : public ::testing::Test {
  std::vector<std::string> log{};
  std::shared_ptr<Registry> registry{std::make_shared<Registry>()};

  void SetUp() override {
    registry->with(std::make_unique<LogLayer>("first", log)).with(std::make_unique<LogLayer>("second", log));
  }
};

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestRegistry, LayersAreNotifiedInOrder) {
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  {
    Span const span = TB_INFO_SPAN("work");
    Span::Entered const entered = span.enter();
    TB_INFO("hello");
  }
  EXPECT_THAT(log, ::testing::ElementsAre("first new work", "second new work", "first event hello in work", "second event hello in work",
                                          "first close work", "second close work"));
  EXPECT_EQ(registry->getOpenSpanCount(), 0U);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestRegistry, IdsAreUniqueAndNonZero) {
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  Span const a = TB_INFO_SPAN("a");
  Span const b = TB_INFO_SPAN("b");
  ASSERT_FALSE(a.isNone());
  ASSERT_FALSE(b.isNone());
  EXPECT_NE(a.getId()->getValue(), 0U);
  EXPECT_NE(b.getId()->getValue(), 0U);
  EXPECT_NE(*a.getId(), *b.getId());
  EXPECT_EQ(registry->getOpenSpanCount(), 2U);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestRegistry, ContextualAndExplicitParents) {
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  Span const outer = TB_WARN_SPAN("outer");
  Span const detached = TB_INFO_SPAN("detached");
  {
    Span::Entered const entered = outer.enter();
    Span const inner = TB_INFO_SPAN("inner");
    EXPECT_EQ(registry->span(*inner.getId())->getParent(), outer.getId());
    Span const root = Span::create(TB_CALLSITE(Level::Info), "root", {}, {}, Parent::root());
    EXPECT_FALSE(registry->span(*root.getId())->getParent().has_value());
    Span const explicitChild = Span::create(TB_CALLSITE(Level::Info), "explicit", {}, {}, parentOf(detached));
    EXPECT_EQ(registry->span(*explicitChild.getId())->getParent(), detached.getId());
  }
  Span const unrelated = TB_INFO_SPAN("unrelated");
  EXPECT_FALSE(registry->span(*unrelated.getId())->getParent().has_value());
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestRegistry, ParentClosesAfterItsChildren) {
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  std::optional<Span> outer{TB_WARN_SPAN("outer")};
  std::optional<Span> inner{};
  {
    Span::Entered const entered = outer->enter();
    inner = TB_INFO_SPAN("inner");
  }
  outer.reset();
  EXPECT_EQ(registry->getOpenSpanCount(), 2U);
  inner.reset();
  EXPECT_EQ(registry->getOpenSpanCount(), 0U);
  EXPECT_THAT(log, ::testing::ElementsAre("first new outer", "second new outer", "first new inner", "second new inner", "first close inner",
                                          "second close inner", "first close outer", "second close outer"));
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestRegistry, CopiesKeepTheSpanOpen) {
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  std::optional<Span> original{TB_INFO_SPAN("shared")};
  Span const copy{*original};
  original.reset();
  EXPECT_EQ(registry->getOpenSpanCount(), 1U);
  {
    Span::Entered const entered = copy.enter();
    Span const current = Span::current();
    EXPECT_EQ(current.getId(), copy.getId());
  }
  EXPECT_TRUE(Span::current().isNone());
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestRegistry, RecordOnlyDeclaredFields) {
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  {
    Span const span = TB_INFO_SPAN("work", {{"index", 1}}, {"data"});
    span.record("data", "some data").record("undeclared", 3);
  }
  EXPECT_THAT(log, ::testing::Contains("first record work data"));
  EXPECT_THAT(log, ::testing::Not(::testing::Contains(::testing::HasSubstr("undeclared"))));
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestRegistryLevel, DisabledLevelsProduceNothing) {
  std::vector<std::string> log{};
  std::shared_ptr<Registry> registry{std::make_shared<Registry>(Level::Info)};
  registry->with(std::make_unique<LogLayer>("only", log));
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  {
    Span const debugSpan = TB_DEBUG_SPAN("hidden");
    EXPECT_TRUE(debugSpan.isNone());
    Span::Entered const entered = debugSpan.enter();
    TB_DEBUG("hidden");
    TB_TRACE("hidden");
    TB_ERROR("shown");
  }
  EXPECT_THAT(log, ::testing::ElementsAre("only event shown in none"));
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestRegistryMock, LifecycleSequence) {
  std::shared_ptr<Registry> registry{std::make_shared<Registry>()};
  std::unique_ptr<MockLayer> layer{std::make_unique<MockLayer>()};
  MockLayer &mock = *layer;
  registry->with(std::move(layer));
  {
    ::testing::InSequence const sequence{};
    EXPECT_CALL(mock, onNewSpan(::testing::_, ::testing::_, ::testing::_));
    EXPECT_CALL(mock, onEnter(::testing::_, ::testing::_));
    EXPECT_CALL(mock, onRecord(::testing::_, ::testing::_, ::testing::_));
    EXPECT_CALL(mock, onEvent(::testing::_, ::testing::_));
    EXPECT_CALL(mock, onExit(::testing::_, ::testing::_));
    EXPECT_CALL(mock, onClose(::testing::_, ::testing::_));
  }
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  Span const span = TB_INFO_SPAN("work", {}, {"data"});
  Span::Entered const entered = span.enter();
  span.record("data", true);
  TB_INFO("message");
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestRegistryLayer, ThrowingLayerClosesTheSpan) {
  std::shared_ptr<Registry> registry{std::make_shared<Registry>()};
  registry->with(std::make_unique<ThrowingLayer>());
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  EXPECT_THROW(static_cast<void>(TB_INFO_SPAN("rejected")), std::logic_error);
  EXPECT_EQ(registry->getOpenSpanCount(), 0U);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestRegistryLayer, RejectedSpanClosesOnlyOnLayersWhichSawIt) {
  std::vector<std::string> log{};
  std::shared_ptr<Registry> registry{std::make_shared<Registry>()};
  registry->with(std::make_unique<LogLayer>("a", log))
      .with(std::make_unique<RejectingLogLayer>(log))
      .with(std::make_unique<LogLayer>("b", log));
  dispatch::DefaultGuard const guard = dispatch::setDefault(registry);
  EXPECT_THROW(static_cast<void>(TB_INFO_SPAN("rejected")), std::logic_error);

  std::vector<std::string> const expected{"a new rejected", "rejecting new rejected", "a close rejected"};
  EXPECT_EQ(log, expected);
  EXPECT_EQ(registry->getOpenSpanCount(), 0U);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestExtensions, InsertGetRemove) {
  Registry registry{};
  Metadata const metadata{"span", "test", Level::Info, "file", 1U, {}, Metadata::Kind::Span};
  ValueSet const values{};
  SpanId const id = registry.newSpan(Attributes{metadata, values, Parent::root()});
  SpanRef const span = *registry.span(id);

  EXPECT_FALSE(span.getExtension<int>().has_value());
  span.insertExtension<int>(5);
  span.insertExtension<std::string>("text");
  EXPECT_EQ(span.getExtension<int>(), 5);
  EXPECT_TRUE(span.hasExtension<std::string>());
  try {
    span.insertExtension<int>(6);
    FAIL() << "expected RuntimeError";
  } catch (tb::RuntimeError const &error) {
    EXPECT_EQ(error.getCode(), tb::ErrorCode::Extension_already_present);
  }
  EXPECT_EQ(span.removeExtension<int>(), 5);
  EXPECT_FALSE(span.removeExtension<int>().has_value());
  EXPECT_TRUE(registry.tryClose(id));
  EXPECT_FALSE(registry.span(id).has_value());
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestExtensions, RejectedInsertLeavesTheValue) {
  Extensions extensions{};
  extensions.insert<std::string>(std::string{"first"});
  std::string value{"second"};
  EXPECT_THROW(extensions.insert<std::string>(std::move(value)), tb::RuntimeError);
  // NOLINTNEXTLINE(bugprone-use-after-move, hicpp-invalid-access-moved)
  EXPECT_EQ(value, "second");
  ASSERT_NE(extensions.get<std::string>(), nullptr);
  EXPECT_EQ(*extensions.get<std::string>(), "first");
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestExtensions, ConcurrentInsertHasOneWinner) {
  Registry registry{};
  Metadata const metadata{"span", "test", Level::Info, "file", 1U, {}, Metadata::Kind::Span};
  ValueSet const values{};
  SpanId const id = registry.newSpan(Attributes{metadata, values, Parent::root()});

  constexpr uint32_t threadCount{8U};
  std::atomic<uint32_t> winners{0U};
  std::vector<std::thread> threads{};
  for (uint32_t i = 0U; i < threadCount; i++) {
    threads.emplace_back([&registry, &winners, id, i]() {
      SpanRef const span = *registry.span(id);
      try {
        span.insertExtension<uint32_t>(i);
        winners.fetch_add(1U);
      } catch (tb::RuntimeError const &error) {
        EXPECT_EQ(error.getCode(), tb::ErrorCode::Extension_already_present);
      }
    });
  }
  for (std::thread &thread : threads) {
    thread.join();
  }
  EXPECT_EQ(winners.load(), 1U);
  EXPECT_TRUE(registry.span(id)->getExtension<uint32_t>().has_value());
  EXPECT_TRUE(registry.tryClose(id));
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestDispatch, ScopedDefaultsNestAndStayOnTheirThread) {
  std::shared_ptr<Registry> const first{std::make_shared<Registry>()};
  std::shared_ptr<Registry> const second{std::make_shared<Registry>()};
  std::shared_ptr<Registry> const before{dispatch::getCurrent()};
  {
    dispatch::DefaultGuard const outerGuard = dispatch::setDefault(first);
    EXPECT_EQ(dispatch::getCurrent(), first);
    {
      dispatch::DefaultGuard const innerGuard = dispatch::setDefault(second);
      EXPECT_EQ(dispatch::getCurrent(), second);
      std::thread other{[&second]() {
        EXPECT_NE(dispatch::getCurrent(), second);
      }};
      other.join();
    }
    EXPECT_EQ(dispatch::getCurrent(), first);
  }
  EXPECT_EQ(dispatch::getCurrent(), before);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestDispatch, GlobalDefaultIsSetOnce) {
  if (!dispatch::hasGlobalDefault()) {
    dispatch::setGlobalDefault(std::make_shared<Registry>());
  }
  EXPECT_TRUE(dispatch::hasGlobalDefault());
  try {
    dispatch::setGlobalDefault(std::make_shared<Registry>());
    FAIL() << "expected RuntimeError";
  } catch (tb::RuntimeError const &error) {
    EXPECT_EQ(error.getCode(), tb::ErrorCode::Global_default_already_set);
  }
}
