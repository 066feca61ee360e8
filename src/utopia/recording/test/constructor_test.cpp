/* Utopia
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "utopia/recording/constructor.hpp"
#include "utopia/recording/test/test_construct.hpp"
#include "utopia/test/test_logger.hpp"
#include <gtest/gtest.h>

namespace utopia::recording::test
{

namespace
{
using std::string;
using std::vector;
using utopia::test::Test_logger;
using Test_constructor = Constructor<Test_construct>;
} // Anonymous namespace

TEST(Constructor, Create_attributes_and_links)
{
  Test_logger logger;
  Test_constructor ctor(&logger, &Test_construct::create);

  ctor.set_instruction("person");
  ctor.create("#alice");
  ctor.add_attribute("name", "Alice");
  ctor.set_instruction("pet");
  ctor.create("#rex");
  ctor.add_attribute("name", "Rex");
  ctor.add_link("owner", "#alice");

  ASSERT_EQ(ctor.constructs().size(), 2u);
  const auto alice = ctor.find("#alice");
  const auto rex = ctor.find("#rex");
  ASSERT_TRUE(alice);
  ASSERT_TRUE(rex);
  EXPECT_FALSE(ctor.find("#nobody"));
  EXPECT_EQ(ctor.latest_construct(), rex);

  EXPECT_EQ(alice->m_id, "#alice");
  EXPECT_EQ(alice->m_instruction, "person");
  EXPECT_EQ(rex->m_instruction, "pet");
  EXPECT_EQ(ctor.instruction(), "pet");
  EXPECT_EQ(alice->attribute("name"), "Alice");
  EXPECT_EQ(rex->attribute("name"), "Rex");
  EXPECT_EQ(rex->link("owner"), alice);

  // Back to Alice: later instructions apply to her.
  ctor.move_to("#alice");
  EXPECT_EQ(ctor.latest_construct(), alice);
  ctor.add_link("pet", "#rex");
  EXPECT_EQ(alice->link("pet"), rex);

  ctor.move_to(rex);
  ctor.add_attribute("breed", "mutt");
  EXPECT_EQ(rex->attribute("breed"), "mutt");
  EXPECT_TRUE(ctor.unresolved_ids().empty());
} // TEST(Constructor, Create_attributes_and_links)

TEST(Constructor, Forward_references)
{
  Test_logger logger;
  Test_constructor ctor(&logger, &Test_construct::create);

  ctor.create("#a");
  ctor.add_link("first", "#c");
  ctor.add_link("second", "#c");
  ctor.create("#b");
  ctor.add_link("third", "#c");
  ctor.add_link("other", "#d");

  EXPECT_EQ(ctor.unresolved_ids(), (vector<string>{ "#c", "#d" }));
  const auto a = ctor.find("#a");
  const auto b = ctor.find("#b");
  EXPECT_FALSE(a->link("first"));
  EXPECT_TRUE(a->m_link_log.empty());

  ctor.create("#c");
  const auto c = ctor.find("#c");
  EXPECT_EQ(a->link("first"), c);
  EXPECT_EQ(a->link("second"), c);
  EXPECT_EQ(b->link("third"), c);
  // In the order they were added, once each.
  EXPECT_EQ(a->m_link_log, (vector<std::pair<string, string>>{ { "first", "#c" }, { "second", "#c" } }));
  EXPECT_EQ(b->m_link_log.size(), 1u);
  EXPECT_EQ(ctor.unresolved_ids(), vector<string>{ "#d" });

  // Nothing further to resolve for #c: creating more does not re-fire.
  ctor.create("#e");
  EXPECT_EQ(a->m_link_log.size(), 2u);

  // A cycle: #d links back to #b which is waiting for it.
  ctor.create("#d");
  ctor.add_link("back", "#b");
  const auto d = ctor.find("#d");
  EXPECT_EQ(b->link("other"), d);
  EXPECT_EQ(d->link("back"), b);
  EXPECT_TRUE(ctor.unresolved_ids().empty());
} // TEST(Constructor, Forward_references)

TEST(Constructor, Errors)
{
  Test_logger logger;
  Test_constructor ctor(&logger, &Test_construct::create);

  Error_code err_code;
  ctor.add_attribute("name", "Nobody", &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_CONSTRUCT_YET);
  err_code.clear();
  ctor.add_link("fella", "#x", &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_CONSTRUCT_YET);
  EXPECT_TRUE(ctor.unresolved_ids().empty());
  EXPECT_THROW(ctor.add_attribute("name", "Nobody"), flow::error::Runtime_error);

  ctor.create("#x");
  const auto x = ctor.find("#x");
  ctor.create("#y");

  // A duplicate changes nothing: not even the latest construct.
  err_code.clear();
  ctor.create("#x", &err_code);
  EXPECT_EQ(err_code, error::Code::S_DUPLICATE_ID);
  EXPECT_EQ(ctor.find("#x"), x);
  EXPECT_EQ(ctor.latest_construct(), ctor.find("#y"));
  EXPECT_THROW(ctor.create("#y"), flow::error::Runtime_error);

  err_code.clear();
  ctor.move_to("#nowhere", &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_ID);
  EXPECT_EQ(ctor.latest_construct(), ctor.find("#y"));

  // Factory declines.
  Test_constructor picky(&logger, [](const string& instruction) -> Test_construct::Ptr
  {
    return (instruction == "person") ? Test_construct::create(instruction) : Test_construct::Ptr();
  });
  err_code.clear();
  picky.create("#rock", &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONSTRUCT_CREATION_FAILED);
  EXPECT_TRUE(picky.constructs().empty());
  picky.set_instruction("person");
  err_code.clear();
  picky.create("#rock", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(picky.constructs().size(), 1u);
} // TEST(Constructor, Errors)

TEST(Constructor, Error_code_reuse)
{
  Test_logger logger;
  Test_constructor ctor(&logger, &Test_construct::create);

  // One Error_code threaded through a sequence of calls reflects the latest call only.
  Error_code err_code;
  ctor.create("#x", &err_code);
  EXPECT_FALSE(err_code);
  ctor.create("#x", &err_code);
  EXPECT_EQ(err_code, error::Code::S_DUPLICATE_ID);
  ctor.create("#y", &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(ctor.find("#y"));

  ctor.move_to("#nowhere", &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_ID);
  ctor.add_attribute("name", "Yves", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(ctor.find("#y")->attribute("name"), "Yves");

  ctor.move_to("#nowhere", &err_code);
  ctor.add_link("fella", "#x", &err_code);
  EXPECT_FALSE(err_code);
  ctor.move_to("#nowhere", &err_code);
  ctor.move_to("#x", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(ctor.latest_construct(), ctor.find("#x"));

  ctor.move_to("#nowhere", &err_code);
  ctor.finish(&err_code);
  EXPECT_FALSE(err_code);
} // TEST(Constructor, Error_code_reuse)

TEST(Constructor, Finish_and_reset)
{
  Test_logger logger;
  {
    Test_constructor ctor(&logger, &Test_construct::create);
    ctor.create("#a");
    ctor.add_link("fella", "#ghost");

    Error_code err_code;
    ctor.finish(&err_code);
    EXPECT_FALSE(err_code); // Lenient by default: only a warning.
    EXPECT_NE(logger.buffer_str().find("#ghost"), string::npos);
    EXPECT_EQ(ctor.unresolved_ids(), vector<string>{ "#ghost" });

    ctor.reset();
    EXPECT_TRUE(ctor.constructs().empty());
    EXPECT_TRUE(ctor.unresolved_ids().empty());
    EXPECT_FALSE(ctor.latest_construct());
    EXPECT_TRUE(ctor.instruction().empty());
    ctor.finish(); // Nothing pending: no throw.

    // The old ID is free again after a reset.
    ctor.create("#a");
    EXPECT_EQ(ctor.constructs().size(), 1u);
  }

  Recording_options opts;
  opts.m_report_unresolved_links = true;
  Test_constructor strict(&logger, &Test_construct::create, opts);
  strict.create("#a");
  strict.add_link("fella", "#ghost");
  Error_code err_code;
  strict.finish(&err_code);
  EXPECT_EQ(err_code, error::Code::S_UNRESOLVED_LINKS);
  EXPECT_THROW(strict.finish(), flow::error::Runtime_error);

  strict.create("#ghost");
  err_code.clear();
  strict.finish(&err_code);
  EXPECT_FALSE(err_code);
} // TEST(Constructor, Finish_and_reset)

} // namespace utopia::recording::test
