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
#pragma once

#include "utopia/recording/recording_fwd.hpp"
#include <boost/program_options.hpp>
#include <string>

namespace utopia::recording
{

/**
 * A set of values controlling the recording formats: the indicators that mark IDs, instructions, and comments; the
 * XML root element name; and whether dangling links are an error.  The defaults match the formats as documented in
 * the recording namespace doc header.
 *
 * A Recording_options is passed by value (copied) into each reader, writer, and Constructor at construction, so
 * changing it afterwards has no effect on them.  The writer and reader of one stream must agree on the indicators.
 *
 * You may fill it manually; or parse a config file or command line using boost.program_options with the help of
 * setup_config_parsing().  You may print it to an `ostream` to see the current values.
 *
 * ### Thread safety ###
 * Same as any `struct` with no locking done therein.
 *
 * @internal
 *
 * To add an option: add the data member (documented); add an ADD_CONFIG_OPTION() line into
 * setup_config_parsing_helper() (the description is usually a copy of the member comment); add its default into the
 * constructor, with a comment if the choice is not obvious.
 */
struct Recording_options
{
  // Types.

  /// Short-hand for boost.program_options config options description.  See setup_config_parsing().
  using Options_description = boost::program_options::options_description;

  // Constructors/destructor.

  /// Constructs a Recording_options with the default values.
  explicit Recording_options();

  // Methods.

  /**
   * Modifies a boost.program_options options description object to enable subsequent parsing of a command line or
   * config file into the data members of this object, as well as printing a help message about these options to an
   * `ostream`.  The option names are derived from the member names: `m_id_indicator` becomes `id-indicator`.  The
   * defaults listed are the current values in `*this`.
   *
   *   ~~~
   *   namespace opts = boost::program_options;
   *   Recording_options rec_opts;
   *   opts::options_description opts_desc;
   *   rec_opts.setup_config_parsing(&opts_desc);
   *   opts::variables_map cfg_vars;
   *   opts::store(opts::parse_config_file(F, opts_desc), cfg_vars);
   *   opts::notify(cfg_vars); // rec_opts is now filled.
   *   ~~~
   *
   * @param opts_desc
   *        The #Options_description object into which to load the help information, defaults, and
   *        mapping to members of `*this`.
   */
  void setup_config_parsing(Options_description* opts_desc);

  // Data.

  /// Prefix marking an ID, both on an ID line and on a link value.  Generated IDs start with it.
  std::string m_id_indicator;

  /// Prefix marking an instruction line in the text format; the remainder of the line is the instruction.
  std::string m_instruction_indicator;

  /// Prefix marking a comment line in the text format (after trimming).
  std::string m_comment_indicator;

  /// Name of the root element written by Xml_object_writer when it opens a document on its own.
  std::string m_xml_root_name;

  /**
   * If and only if this is `true`, Constructor::finish() fails with recording::error::Code::S_UNRESOLVED_LINKS when
   * links to never-created IDs remain; otherwise it only logs a warning.
   */
  bool m_report_unresolved_links;

private:
  // Friends.

  // Friend of Recording_options: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Recording_options& opts);

  // Methods.

  /**
   * For a given option `m_blah_blah` takes `"m_blah_blah"` and returns the option name users see: `"blah-blah"`.
   *
   * @param opt_id
   *        A string whose content equals the name (in C++ code) of a data member.
   * @return See above.
   */
  static std::string opt_id_to_str(const std::string& opt_id);

  /**
   * A helper that adds a single option to a given #Options_description, either for printing out the current state
   * or for parsing into a Recording_options.
   *
   * @tparam Opt_type
   *         The type of a data member.
   * @param opts_desc
   *        The #Options_description object into which to load a single `option_description`.
   * @param opt_id
   *        A string whose content equals the name (in C++ code) of the data member.
   * @param target_val
   *        If `!printout_only`, and the user parses via `*opts_desc`, the parsed option value will be
   *        loaded into `*target_val`.  Otherwise ignored.
   * @param default_val
   *        The default value to this option in `*opts_desc` will be this.
   * @param description
   *        If `!printout_only`, the detailed description of the option will be this.  Otherwise ignored.
   * @param printout_only
   *        See above.
   */
  template<typename Opt_type>
  static void add_config_option(Options_description* opts_desc,
                                const std::string& opt_id,
                                Opt_type* target_val, const Opt_type& default_val,
                                const char* description, bool printout_only);

  /**
   * Loads the full set of options into the given #Options_description: with descriptions and targets inside
   * `*target` (`!printout_only`), for help and parsing; or with only names and `defaults_source` values as
   * "defaults" (`printout_only`), for printing `defaults_source`.
   *
   * @param opts_desc
   *        The #Options_description object to load.
   * @param target
   *        If `!printout_only`, parsed values end up in members of `*target`.
   * @param defaults_source
   *        The defaults listed for each option.
   * @param printout_only
   *        See above.
   */
  static void setup_config_parsing_helper(Options_description* opts_desc,
                                          Recording_options* target,
                                          const Recording_options& defaults_source,
                                          bool printout_only);
}; // struct Recording_options

} // namespace utopia::recording
