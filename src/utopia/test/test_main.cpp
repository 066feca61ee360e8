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

#include "utopia/test/test_logger.hpp"
#include "utopia/test/test_config.hpp"
#include <flow/log/log.hpp>
#include <boost/program_options.hpp>
#include <gtest/gtest.h>
#include <iostream>
#include <string>
#include <vector>

namespace utopia::test
{

const std::string Test_config::S_HELP_PARAM = "help";
const std::string Test_config::S_LOG_SEVERITY_PARAM = "minimum-log-severity";
const std::string Test_config::S_LOG_COMPONENT_SEVERITY_PARAM = "log-component-severity";

} // namespace utopia::test

int main(int argc, char** argv)
{
  namespace opts = boost::program_options;
  using utopia::test::Test_config;

  // gtest strips its own --gtest_* arguments from argv first.
  ::testing::InitGoogleTest(&argc, argv);

  auto& config = Test_config::get_singleton();

  opts::options_description cmd_line_opts("Unit test options");
  cmd_line_opts.add_options()
    (Test_config::S_HELP_PARAM.c_str(), "Show help")
    (Test_config::S_LOG_SEVERITY_PARAM.c_str(),
     opts::value<flow::log::Sev>(&config.m_sev)->default_value(config.m_sev),
     "Minimum log severity shown on the console")
    (Test_config::S_LOG_COMPONENT_SEVERITY_PARAM.c_str(),
     opts::value<std::vector<std::string>>(&config.m_component_sevs),
     "Minimum console severity for one component, as <component>=<severity> (e.g., utopia-RECORDING=TRACE); "
       "may be repeated");

  opts::variables_map vm;
  try
  {
    opts::store(opts::command_line_parser(argc, argv).options(cmd_line_opts).allow_unregistered().run(), vm);
    opts::notify(vm);
  }
  catch (const opts::error& exc)
  {
    std::cerr << "Command line error: [" << exc.what() << "].\n" << cmd_line_opts << '\n';
    return 1;
  }

  if (vm.count(Test_config::S_HELP_PARAM) != 0)
  {
    std::cout << cmd_line_opts << '\n';
    return 0;
  }

  // Vet the per-component settings once, here, against a scratch logger's component names.
  utopia::test::Test_logger scratch_logger;
  for (const auto& component_sev : config.m_component_sevs)
  {
    if (!utopia::test::Test_logger::configure_component_sev(&scratch_logger.get_config(), component_sev))
    {
      std::cerr << "Bad --" << Test_config::S_LOG_COMPONENT_SEVERITY_PARAM << " [" << component_sev << "]: "
                   "expected <component>=<severity> with a known component and severity.\n";
      return 1;
    }
  }

  return RUN_ALL_TESTS();
}
