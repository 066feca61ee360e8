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

#pragma once

#include "utopia/common.hpp"
#include <boost/filesystem.hpp>
#include <string>

namespace utopia::test
{

/**
 * Temporary file that is removed when the object is destroyed.
 */
class Temp_file
{
public:
  /**
   * Creates a uniquely named file in the system temporary directory with the given contents.
   *
   * @param contents What to write into the file.
   * @param extension Extension (including the dot) to give the file name.
   */
  explicit Temp_file(const std::string& contents, const std::string& extension = ".txt");

  /// Removes the file, ignoring failures.
  ~Temp_file();

  /**
   * Returns the path to the file.
   *
   * @return See above.
   */
  const boost::filesystem::path& path() const;

private:
  /// See path().
  boost::filesystem::path m_path;
}; // class Temp_file

/**
 * Returns the entire contents of the given file; empty if it cannot be read.
 *
 * @param file_path The path to the file to read.
 *
 * @return See above.
 */
std::string read_file(const boost::filesystem::path& file_path);

/**
 * Returns whether a file exists.
 *
 * @param file_path The path to the file to check.
 * @param ec Any error that occurred.
 *
 * @return See above; a positive value is also an indicator that there was no error.
 */
bool does_file_exist(const boost::filesystem::path& file_path, Error_code& ec);

} // namespace utopia::test
