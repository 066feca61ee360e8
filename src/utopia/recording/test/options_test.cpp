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
#include "utopia/recording/options.hpp"
#include "utopia/recording/text_instructor.hpp"
#include "utopia/recording/text_object_writer.hpp"
#include "utopia/recording/test/test_construct.hpp"
#include "utopia/test/test_logger.hpp"
#include <flow/util/util.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace utopia::recording::test
{

namespace
{
using std::string;
using utopia::test::Test_logger;
namespace opts = boost::program_options;
} // Anonymous namespace

TEST(Recording_options, Defaults_and_printout)
{
  const Recording_options rec_opts;
  EXPECT_EQ(rec_opts.m_id_indicator, "#");
  EXPECT_EQ(rec_opts.m_instruction_indicator, "%CHECK:");
  EXPECT_EQ(rec_opts.m_comment_indicator, "//");
  EXPECT_EQ(rec_opts.m_xml_root_name, "root");
  EXPECT_FALSE(rec_opts.m_report_unresolved_links);

  const auto printout = util::ostream_op_string(rec_opts);
  EXPECT_NE(printout.find("Recording option values"), string::npos) << printout;
  EXPECT_NE(printout.find("--id-indicator"), string::npos) << printout;
  EXPECT_NE(printout.find("--report-unresolved-links"), string::npos) << printout;
  EXPECT_NE(printout.find("%CHECK:"), string::npos) << printout;
} // TEST(Recording_options, Defaults_and_printout)

TEST(Recording_options, Config_file_parsing)
{
  Recording_options rec_opts;
  opts::options_description opts_desc;
  rec_opts.setup_config_parsing(&opts_desc);

  std::istringstream cfg("id-indicator = @\n"
                         "instruction-indicator = !do:\n"
                         "report-unresolved-links = true\n");
  opts::variables_map cfg_vars;
  opts::store(opts::parse_config_file(cfg, opts_desc), cfg_vars);
  opts::notify(cfg_vars);

  EXPECT_EQ(rec_opts.m_id_indicator, "@");
  EXPECT_EQ(rec_opts.m_instruction_indicator, "!do:");
  EXPECT_EQ(rec_opts.m_comment_indicator, "//"); // Unmentioned: default kept.
  EXPECT_TRUE(rec_opts.m_report_unresolved_links);

  // Unknown options are rejected by boost.program_options.
  Recording_options other;
  opts::options_description other_desc;
  other.setup_config_parsing(&other_desc);
  std::istringstream bad_cfg("no-such-option = 1\n");
  EXPECT_THROW(opts::store(opts::parse_config_file(bad_cfg, other_desc), cfg_vars), opts::error);
} // TEST(Recording_options, Config_file_parsing)

TEST(Recording_options, Custom_indicators_end_to_end)
{
  Test_logger logger;
  Recording_options rec_opts;
  rec_opts.m_id_indicator = "@";
  rec_opts.m_instruction_indicator = "!do:";
  rec_opts.m_comment_indicator = ";";

  Test_construct alice("");
  alice.set_attribute("name", "Alice");
  alice.set_attribute("motto", "#1 fan"); // Not a link under this indicator.

  Text_object_writer writer(&logger, rec_opts);
  std::ostringstream os;
  os << "; A comment in the custom style.\n";
  writer.write_instruction("person", os);
  writer.write_into(alice, os);
  const auto alice_id = writer.id_for(alice);
  EXPECT_EQ(alice_id.front(), '@');

  Constructor<Test_construct> ctor(&logger, &Test_construct::create, rec_opts);
  Text_instructor<Test_construct> instructor(&logger, &ctor);
  std::istringstream is(os.str());
  instructor.construct_from(is);

  const auto read_alice = ctor.find(alice_id);
  ASSERT_TRUE(read_alice) << os.str();
  EXPECT_EQ(read_alice->m_instruction, "person");
  EXPECT_EQ(read_alice->attributes(), alice.attributes());
} // TEST(Recording_options, Custom_indicators_end_to_end)

} // namespace utopia::recording::test
