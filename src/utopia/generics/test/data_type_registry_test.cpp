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
#include "utopia/generics/data_type_registry.hpp"
#include "utopia/generics/error/error.hpp"
#include "utopia/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/optional/optional_io.hpp>
#include <sstream>

namespace utopia::generics::test
{

namespace
{
using std::string;
using utopia::test::Test_logger;
using R = Conversion_reliability;
namespace types = basic_types;

/// Parses hexadecimal STRING values into INTEGER; the basic parser would reject "ff".
class Hex_parser : public Value_parser
{
public:
  std::vector<Conversion> conversions() const override
  {
    return { { types::string(), types::integer(), R::S_DANGEROUS } };
  }

  Value parse(const Value& value, const Data_type&, Error_code* err_code) const override
  {
    std::istringstream is(boost::any_cast<string>(value.raw()));
    int32_t result;
    if (!(is >> std::hex >> result) || !is.eof())
    {
      *err_code = error::Code::S_VALUE_PARSE_FAILED;
      return Value();
    }
    return Value::of_integer(result);
  }
}; // class Hex_parser

/// Declares STRING to SHOUT, a type the basic parser knows nothing about; the payload is upper-cased.
class Shout_parser : public Value_parser
{
public:
  static const Data_type& shout()
  {
    static const Data_type s_type("SHOUT");
    return s_type;
  }

  std::vector<Conversion> conversions() const override
  {
    return { { types::string(), shout(), R::S_DATA_LOSS } };
  }

  Value parse(const Value& value, const Data_type& to, Error_code*) const override
  {
    return Value(boost::algorithm::to_upper_copy(boost::any_cast<string>(value.raw())), to);
  }
}; // class Shout_parser

} // Anonymous namespace

TEST(Data_type_registry, Hierarchy)
{
  Test_logger logger;
  auto registry = Data_type_registry::create_with_basic_types(&logger);

  EXPECT_TRUE(registry.contains(types::integer()));
  EXPECT_TRUE(registry.contains(types::model()));
  EXPECT_FALSE(registry.contains(Data_type("UNHEARD_OF")));

  EXPECT_TRUE(registry.is_of_type(types::integer(), types::number()));
  EXPECT_TRUE(registry.is_of_type(types::double_(), types::number()));
  EXPECT_TRUE(registry.is_of_type(types::integer(), types::integer()));
  EXPECT_FALSE(registry.is_of_type(types::number(), types::integer()));
  EXPECT_FALSE(registry.is_of_type(types::string(), types::number()));
  EXPECT_EQ(registry.parent_of(types::long_()), types::number());
  EXPECT_FALSE(registry.parent_of(types::number()));

  Error_code err_code;
  EXPECT_FALSE(registry.is_of_type(Data_type("UNHEARD_OF"), types::number(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_DATA_TYPE_NOT_REGISTERED);
  EXPECT_THROW(registry.is_of_type(Data_type("UNHEARD_OF"), types::number()), flow::error::Runtime_error);

  // A new type under an existing one, then a grandchild.
  const Data_type small_int("SMALL_INTEGER");
  const Data_type tiny_int("TINY_INTEGER");
  registry.register_type(small_int, types::integer());
  registry.register_type(tiny_int, small_int);
  EXPECT_TRUE(registry.is_of_type(tiny_int, types::number()));
  EXPECT_FALSE(registry.is_of_type(tiny_int, types::long_()));
} // TEST(Data_type_registry, Hierarchy)

TEST(Data_type_registry, Registration_errors_and_replacement)
{
  Test_logger logger;
  auto registry = Data_type_registry::create_with_basic_types(&logger);

  Error_code err_code;
  registry.register_type(Data_type("ORPHAN"), Data_type("NO_SUCH_PARENT"), &err_code);
  EXPECT_EQ(err_code, error::Code::S_DATA_TYPE_NOT_REGISTERED);
  EXPECT_FALSE(registry.contains(Data_type("ORPHAN")));

  // NUMBER under its own child: a cycle.  Nothing may change.
  err_code.clear();
  registry.register_type(types::number(), types::integer(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_DATA_TYPE_HIERARCHY_CYCLE);
  EXPECT_EQ(registry.parent_of(types::integer()), types::number());
  EXPECT_FALSE(registry.parent_of(types::number()));

  err_code.clear();
  registry.register_type(types::string(), types::string(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_DATA_TYPE_HIERARCHY_CYCLE);

  EXPECT_THROW(registry.register_type(types::number(), types::double_()), flow::error::Runtime_error);

  // Replacing NUMBER orphans its children until they are registered again.
  registry.register_type(types::number());
  EXPECT_FALSE(registry.parent_of(types::integer()));
  EXPECT_FALSE(registry.is_of_type(types::integer(), types::number()));
  EXPECT_TRUE(registry.contains(types::integer()));

  registry.register_type(types::integer(), types::number());
  EXPECT_TRUE(registry.is_of_type(types::integer(), types::number()));
  EXPECT_FALSE(registry.is_of_type(types::long_(), types::number()));

  // Turning NUMBER and INTEGER around takes two steps: INTEGER out from under NUMBER, then NUMBER under INTEGER.
  {
    auto flipped = Data_type_registry::create_with_basic_types(&logger);
    err_code.clear();
    flipped.register_type(types::number(), types::integer(), &err_code);
    EXPECT_EQ(err_code, error::Code::S_DATA_TYPE_HIERARCHY_CYCLE);
    flipped.register_type(types::integer());
    flipped.register_type(types::number(), types::integer(), &err_code);
    EXPECT_FALSE(err_code);
    EXPECT_TRUE(flipped.is_of_type(types::number(), types::integer()));
  }

  // A replacement may move a root under a parent.
  registry.register_type(types::boolean(), types::extra_boolean());
  EXPECT_TRUE(registry.is_of_type(types::boolean(), types::extra_boolean()));
} // TEST(Data_type_registry, Registration_errors_and_replacement)

TEST(Data_type_registry, Reliability_and_cost)
{
  Test_logger logger;
  const auto registry = Data_type_registry::create_with_basic_types(&logger);

  EXPECT_EQ(registry.conversion_reliability(types::integer(), types::integer()), R::S_PERFECT);
  EXPECT_EQ(registry.conversion_cost(types::integer(), types::integer()), 0);

  EXPECT_EQ(registry.conversion_reliability(types::integer(), types::string()), R::S_PERFECT);
  EXPECT_EQ(registry.conversion_reliability(types::string(), types::integer()), R::S_DANGEROUS);
  EXPECT_EQ(registry.conversion_reliability(types::integer(), types::long_()), R::S_PERFECT);
  EXPECT_EQ(registry.conversion_reliability(types::long_(), types::integer()), R::S_DATA_LOSS);
  EXPECT_EQ(registry.conversion_reliability(types::integer(), types::boolean()), R::S_MEANING_LOSS);
  EXPECT_EQ(registry.conversion_cost(types::long_(), types::integer()), 7);

  // A cheaper multi-step route beats a direct edge: BOOLEAN -> EXTRA_BOOLEAN -> DOUBLE (1 + 1) over 25.
  EXPECT_EQ(registry.conversion_reliability(types::boolean(), types::double_()), R::S_PERFECT);
  EXPECT_EQ(registry.conversion_cost(types::boolean(), types::double_()), 2);

  // Multi-step: EXTRA_BOOLEAN -> DOUBLE -> NUMBER, both perfect.
  EXPECT_EQ(registry.conversion_reliability(types::extra_boolean(), types::number()), R::S_PERFECT);
  EXPECT_EQ(registry.conversion_cost(types::extra_boolean(), types::number()), 2);

  // INTEGER -> EXTRA_BOOLEAN has no direct edge; the cheapest routes cost 1 + 25 and are MEANING_LOSS at worst.
  EXPECT_EQ(registry.conversion_reliability(types::integer(), types::extra_boolean()), R::S_MEANING_LOSS);
  EXPECT_EQ(registry.conversion_cost(types::integer(), types::extra_boolean()), 26);

  // DATE -> STRING -> INTEGER.
  EXPECT_EQ(registry.conversion_reliability(types::date(), types::integer()), R::S_DANGEROUS);
  EXPECT_EQ(registry.conversion_cost(types::date(), types::integer()), 31);

  // VARIABLE and MODEL have no conversions at all.
  EXPECT_EQ(registry.conversion_reliability(types::variable(), types::integer()), R::S_NO_CONVERSION);
  EXPECT_EQ(registry.conversion_cost(types::variable(), types::integer()), -1);
  EXPECT_FALSE(registry.conversion_possible(types::integer(), types::model()));
  EXPECT_TRUE(registry.conversion_possible(types::model(), types::model()));

  EXPECT_EQ(registry.find_optimal_target_type(types::integer(), { types::boolean(), types::long_() }),
            types::long_());
  EXPECT_EQ(registry.find_optimal_target_type(types::integer(), { types::string(), types::long_() }),
            types::string()); // Tie: the earlier candidate wins.
  EXPECT_EQ(registry.find_optimal_target_type(types::integer(), { types::long_(), types::integer() }),
            types::integer());
  EXPECT_FALSE(registry.find_optimal_target_type(types::integer(), { types::variable(), types::model() }));

  EXPECT_TRUE(registry.input_types().count(types::date_time()) == 1);
  EXPECT_TRUE(registry.output_types().count(types::variable()) == 0);
} // TEST(Data_type_registry, Reliability_and_cost)

TEST(Data_type_registry, Convert)
{
  Test_logger logger;
  const auto registry = Data_type_registry::create_with_basic_types(&logger);

  EXPECT_EQ(registry.convert(Value::of_string("42"), types::integer()), Value::of_integer(42));
  EXPECT_EQ(registry.convert(Value::of_string(" 4.2 "), types::integer()), Value::of_integer(4));
  EXPECT_EQ(registry.convert(Value::of_double(-3.9), types::integer()), Value::of_integer(-3));
  EXPECT_EQ(registry.convert(Value::of_integer(7), types::number()), Value::of_number(7));
  EXPECT_EQ(registry.convert(Value::of_integer(7), types::integer()), Value::of_integer(7));

  const auto null_result = registry.convert(Value::null(types::string()), types::date());
  EXPECT_TRUE(null_result.is_null());
  EXPECT_EQ(null_result.type(), types::date());

  Error_code err_code;
  registry.convert(Value::of_string("abc"), types::integer(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_PARSE_FAILED);

  err_code.clear();
  registry.convert(Value::of_long(int64_t(1) << 40), types::integer(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_PARSE_FAILED);

  // Chosen by type sets (DATE is an input, INTEGER an output) even though the pair itself is never declared.
  err_code.clear();
  registry.convert(Value::of_date(boost::gregorian::date(2024, 1, 31)), types::integer(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_PARSE_FAILED);

  err_code.clear();
  registry.convert(Value(string("x"), types::variable()), types::integer(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_PARSER_FOR_CONVERSION);

  try
  {
    registry.convert(Value::of_string("abc"), types::integer());
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_VALUE_PARSE_FAILED);
    const string what = exc.what();
    EXPECT_NE(what.find("[abc (STRING)]"), string::npos) << what;
    EXPECT_NE(what.find("from [STRING] to [INTEGER]"), string::npos) << what;
  }

  // Along the route EXTRA_BOOLEAN -> DOUBLE -> NUMBER.
  EXPECT_EQ(registry.convert_along_route(Value::of_extra_boolean(Extra_boolean::S_WEAK_TRUE), types::number()),
            Value::of_number(0.6));
  EXPECT_EQ(registry.convert_along_route(Value::of_integer(5), types::extra_boolean()),
            Value::of_extra_boolean(Extra_boolean::S_EXTRA_TRUE));
  err_code.clear();
  registry.convert_along_route(Value::of_integer(5), types::model(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_PARSER_FOR_CONVERSION);
} // TEST(Data_type_registry, Convert)

TEST(Data_type_registry, Parser_chain)
{
  Test_logger logger;
  const auto hex_parser = boost::make_shared<Hex_parser>();

  {
    auto registry = Data_type_registry::create_with_basic_types(&logger);
    registry.add_parser(hex_parser, true);
    EXPECT_EQ(registry.convert(Value::of_string("ff"), types::integer()), Value::of_integer(255));
  }

  {
    auto registry = Data_type_registry::create_with_basic_types(&logger);
    registry.add_parser(hex_parser, false);
    // Adding it again, even as primary, is a no-op: the basic parser still comes first.
    registry.add_parser(hex_parser, true);

    Error_code err_code;
    registry.convert(Value::of_string("ff"), types::integer(), &err_code);
    EXPECT_EQ(err_code, error::Code::S_VALUE_PARSE_FAILED);
    EXPECT_EQ(registry.convert(Value::of_string("12"), types::integer()), Value::of_integer(12));
  }

  {
    // Adding a parser must invalidate cached routes.
    auto registry = Data_type_registry::create_with_basic_types(&logger);
    EXPECT_FALSE(registry.conversion_possible(types::integer(), Shout_parser::shout()));

    registry.add_parser(boost::make_shared<Shout_parser>());
    EXPECT_EQ(registry.conversion_cost(types::integer(), Shout_parser::shout()), 1 + 7);
    EXPECT_EQ(registry.conversion_reliability(types::integer(), Shout_parser::shout()), R::S_DATA_LOSS);
    EXPECT_TRUE(registry.convert(Value::of_string("abc"), Shout_parser::shout()).raw().type() == typeid(string));
    EXPECT_EQ(boost::any_cast<string>(registry.convert_along_route(Value::of_boolean(true),
                                                                   Shout_parser::shout()).raw()),
              "TRUE");
  }
} // TEST(Data_type_registry, Parser_chain)

TEST(Conversion_reliability, Ordering)
{
  EXPECT_TRUE(is_better_than(R::S_PERFECT, R::S_DATA_LOSS));
  EXPECT_TRUE(is_better_than(R::S_DANGEROUS, R::S_NO_CONVERSION));
  EXPECT_FALSE(is_better_than(R::S_MEANING_LOSS, R::S_MEANING_LOSS));
  EXPECT_EQ(worse_of(R::S_DATA_LOSS, R::S_MEANING_LOSS), R::S_MEANING_LOSS);
  EXPECT_EQ(conversion_step_cost(R::S_DANGEROUS), 30);
  EXPECT_EQ(conversion_step_cost(R::S_NO_CONVERSION), -1);
  EXPECT_EQ(util::ostream_op_string(R::S_DATA_LOSS), "DATA_LOSS");
  EXPECT_EQ(util::ostream_op_string(Conversion{ types::long_(), types::integer(), R::S_DATA_LOSS }),
            "LONG -> INTEGER (DATA_LOSS)");
}

} // namespace utopia::generics::test
