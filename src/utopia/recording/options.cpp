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
#include "utopia/util/id_generator.hpp"
#include <boost/algorithm/string.hpp>

// Internal macros (#undef at the end of file).

/// @cond
/* -^- Doxygen, please ignore the following.  (Don't want docs generated for temp macro; this is more maintainable
 * than specifying the macro name to omit it, in Doxygen-config EXCLUDE_SYMBOLS.) */

#define ADD_CONFIG_OPTION(ARG_opt, ARG_desc) \
  Recording_options::add_config_option(opts_desc, #ARG_opt, &target->ARG_opt, defaults_source.ARG_opt, ARG_desc, \
                                       printout_only)

// -v- Doxygen, please stop ignoring.
/// @endcond

namespace utopia::recording
{

// Implementations.

Recording_options::Recording_options() :
  m_id_indicator(util::Id_generator::S_DEFAULT_ID_INDICATOR),
  m_instruction_indicator("%CHECK:"),
  m_comment_indicator("//"),
  m_xml_root_name("root"),
  // Dangling links are common while a recording is partial; opt into strictness.
  m_report_unresolved_links(false)
{
  // Nothing.
}

template<typename Opt_type>
void Recording_options::add_config_option(Options_description* opts_desc,
                                          const std::string& opt_id,
                                          Opt_type* target_val, const Opt_type& default_val,
                                          const char* description, bool printout_only) // Static.
{
  using boost::program_options::value;
  if (printout_only)
  {
    opts_desc->add_options()
      (opt_id_to_str(opt_id).c_str(), value<Opt_type>()->default_value(default_val));
  }
  else
  {
    opts_desc->add_options()
      (opt_id_to_str(opt_id).c_str(), value<Opt_type>(target_val)->default_value(default_val),
       description);
  }
}

void Recording_options::setup_config_parsing_helper(Options_description* opts_desc,
                                                    Recording_options* target,
                                                    const Recording_options& defaults_source,
                                                    bool printout_only) // Static.
{
  ADD_CONFIG_OPTION
    (m_id_indicator,
     "Prefix marking an ID, both on an ID line and on a link value.  Generated IDs start with it.");
  ADD_CONFIG_OPTION
    (m_instruction_indicator,
     "Prefix marking an instruction line in the text format; the remainder of the line is the instruction.");
  ADD_CONFIG_OPTION
    (m_comment_indicator,
     "Prefix marking a comment line in the text format (after trimming).");
  ADD_CONFIG_OPTION
    (m_xml_root_name,
     "Name of the root element written when an XML document is opened implicitly.");
  ADD_CONFIG_OPTION
    (m_report_unresolved_links,
     "If and only if this is true, finishing a construction with links to never-created IDs is an error; "
       "otherwise it only logs a warning.");
} // Recording_options::setup_config_parsing_helper()

void Recording_options::setup_config_parsing(Options_description* opts_desc)
{
  // Set up *opts_desc to parse into *this when the caller chooses to.  Take defaults from *this.
  setup_config_parsing_helper(opts_desc, this, *this, false);
}

std::ostream& operator<<(std::ostream& os, const Recording_options& opts)
{
  Recording_options sink;
  Recording_options::Options_description opts_desc{"Recording option values"};
  Recording_options::setup_config_parsing_helper(&opts_desc, &sink, opts, true);
  return os << opts_desc;
}

std::string Recording_options::opt_id_to_str(const std::string& opt_id) // Static.
{
  using boost::algorithm::starts_with;
  using boost::algorithm::replace_all;
  using std::string;

  const string MEMBER_PREFIX = "m_";

  string str = opt_id;
  if (starts_with(opt_id, MEMBER_PREFIX))
  {
    str.erase(0, MEMBER_PREFIX.size());
  }

  replace_all(str, "_", "-");

  return str;
}

} // namespace utopia::recording

#undef ADD_CONFIG_OPTION // For cleanliness.
