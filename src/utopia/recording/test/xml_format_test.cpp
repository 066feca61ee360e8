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
#include "utopia/recording/xml_instructor.hpp"
#include "utopia/recording/xml_object_writer.hpp"
#include "utopia/recording/xml_element_reader.hpp"
#include "utopia/recording/xml_name.hpp"
#include "utopia/recording/test/test_construct.hpp"
#include "utopia/test/test_logger.hpp"
#include "utopia/test/test_file_util.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace utopia::recording::test
{

namespace
{
using std::string;
using std::vector;
using utopia::test::Test_logger;
using utopia::test::Temp_file;
using Test_constructor = Constructor<Test_construct>;
using Test_instructor = Xml_instructor<Test_construct>;

/// Records every event as a line of text.
class Recording_handler : public Xml_element_handler
{
public:
  void on_start_element(const string& name, unsigned int depth, Error_code*) override
  {
    m_events.push_back("start " + name + ' ' + std::to_string(depth));
  }

  void on_characters(const string& text, Error_code*) override
  {
    m_events.push_back("chars [" + text + ']');
  }

  void on_end_element(const string& name, unsigned int depth, Error_code* err_code) override
  {
    m_events.push_back("end " + name + ' ' + std::to_string(depth));
    if (name == m_fail_at_end_of)
    {
      *err_code = error::Code::S_MALFORMED_XML_STRUCTURE;
    }
  }

  vector<string> m_events;
  string m_fail_at_end_of;
}; // class Recording_handler

/// Writable with only fixed links.
class Fixed_links_writable : public Writable
{
public:
  Attributes attributes() const override
  {
    return Attributes();
  }

  Links links() const override
  {
    return m_links;
  }

  Links m_links;
}; // class Fixed_links_writable

} // Anonymous namespace

TEST(Xml_name, Codec)
{
  EXPECT_EQ(encode_xml_name("#abc"), "_x0023_abc");
  EXPECT_EQ(decode_xml_name("_x0023_abc"), "#abc");
  EXPECT_EQ(encode_xml_name("plain_name-2.x"), "plain_name-2.x");
  EXPECT_EQ(encode_xml_name("1st"), "_x0031_st");
  EXPECT_EQ(encode_xml_name("a b:c"), "a_x0020_b_x003A_c");
  EXPECT_EQ(encode_xml_name("-dash"), "_x002D_dash");

  // Something that already looks like an escape is protected.
  EXPECT_EQ(encode_xml_name("_x0041_"), "_x005F_x0041_");
  EXPECT_EQ(decode_xml_name("_x005F_x0041_"), "_x0041_");

  // Non-ASCII passes through; escapes above ASCII decode to UTF-8.
  EXPECT_EQ(encode_xml_name("h\xC3\xA9llo"), "h\xC3\xA9llo");
  EXPECT_EQ(decode_xml_name("_x00E9_t_x00e9_"), "\xC3\xA9t\xC3\xA9");

  // Not escapes: copied as they are.
  EXPECT_EQ(decode_xml_name("bad_xZZZZ_"), "bad_xZZZZ_");
  EXPECT_EQ(decode_xml_name("short_x41_"), "short_x41_");

  for (const string& name : { "#k2j9x", "with space", "x", "_", "_x", "%CHECK:odd", "9lives" })
  {
    EXPECT_EQ(decode_xml_name(encode_xml_name(name)), name);
  }
} // TEST(Xml_name, Codec)

TEST(Xml_element_reader, Events)
{
  Test_logger logger;
  Xml_element_reader reader(&logger);

  Recording_handler handler;
  reader.read_string("<?xml version=\"1.0\"?>\n"
                     "<doc>\n"
                     "  <!-- a comment -->\n"
                     "  <_x0023_a>\n"
                     "    <name>Al &amp; Co</name>\n"
                     "    <empty><![CDATA[]]></empty>\n"
                     "    <blank>   </blank>\n"
                     "  </_x0023_a>\n"
                     "</doc>\n",
                     &handler);
  EXPECT_EQ(handler.m_events, (vector<string>{ "start doc 0",
                                                "start #a 1",
                                                "start name 2", "chars [Al & Co]", "end name 2",
                                                "start empty 2", "chars []", "end empty 2",
                                                "start blank 2", "end blank 2",
                                                "end #a 1",
                                                "end doc 0" }));

  // The handler may stop the walk.
  Recording_handler stopper;
  stopper.m_fail_at_end_of = "a";
  Error_code err_code;
  reader.read_string("<r><a/><b/></r>", &stopper, &err_code);
  EXPECT_EQ(err_code, error::Code::S_MALFORMED_XML_STRUCTURE);
  EXPECT_EQ(stopper.m_events, (vector<string>{ "start r 0", "start a 1", "end a 1" }));

  // From a stream, too.
  Recording_handler stream_handler;
  std::istringstream is("<r/>");
  reader.read(is, &stream_handler);
  EXPECT_EQ(stream_handler.m_events, (vector<string>{ "start r 0", "end r 0" }));
} // TEST(Xml_element_reader, Events)

TEST(Xml_element_reader, Malformed)
{
  Test_logger logger;
  Xml_element_reader reader(&logger);

  for (const string& xml : { "", "   ", "<root><unclosed></root>", "not xml at all", "<a></b>" })
  {
    Recording_handler handler;
    Error_code err_code;
    reader.read_string(xml, &handler, &err_code);
    EXPECT_EQ(err_code, error::Code::S_MALFORMED_XML) << '[' << xml << ']';
    EXPECT_TRUE(handler.m_events.empty());
  }

  Recording_handler handler;
  EXPECT_THROW(reader.read_string("<a>", &handler), flow::error::Runtime_error);

  Error_code err_code;
  reader.read_file("/no/such/dir/no_such_file.xml", &handler, &err_code);
  EXPECT_EQ(err_code, error::Code::S_FILE_NOT_FOUND);
} // TEST(Xml_element_reader, Malformed)

TEST(Xml_instructor, Reading_and_structure_errors)
{
  Test_logger logger;
  {
    Test_constructor ctor(&logger, &Test_construct::create);
    Test_instructor instructor(&logger, &ctor);
    instructor.construct_from_string("<root>"
                                     "<person>"
                                     "<_x0023_a><name>Alice</name><fella><![CDATA[#b]]></fella></_x0023_a>"
                                     "</person>"
                                     "<robot>"
                                     "<_x0023_b><name><![CDATA[Bob]]></name><fella>#a</fella></_x0023_b>"
                                     "</robot>"
                                     "</root>");
    const auto a = ctor.find("#a");
    const auto b = ctor.find("#b");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a->m_instruction, "person");
    EXPECT_EQ(b->m_instruction, "robot");
    EXPECT_EQ(a->attribute("name"), "Alice");
    EXPECT_EQ(b->attribute("name"), "Bob");
    EXPECT_EQ(a->link("fella"), b);
    EXPECT_EQ(b->link("fella"), a);
  }

  for (const string& xml : { "<root>stray</root>",
                             "<root><person>stray</person></root>",
                             "<root><_x0023_a>stray</_x0023_a></root>",
                             "<root><_x0023_a><name>x</name>stray</_x0023_a></root>" })
  {
    Test_constructor ctor(&logger, &Test_construct::create);
    Test_instructor instructor(&logger, &ctor);
    Error_code err_code;
    instructor.construct_from_string(xml, &err_code);
    EXPECT_EQ(err_code, error::Code::S_MALFORMED_XML_STRUCTURE) << xml;
  }

  // Attribute before any object.
  Test_constructor ctor(&logger, &Test_construct::create);
  Test_instructor instructor(&logger, &ctor);
  Error_code err_code;
  instructor.construct_from_string("<root><person><name>x</name></person></root>", &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_CONSTRUCT_YET);
  EXPECT_THROW(instructor.construct_from_string("<root><oops"), flow::error::Runtime_error);
} // TEST(Xml_instructor, Reading_and_structure_errors)

TEST(Xml_object_writer, Round_trip_with_cycle)
{
  Test_logger logger;

  Test_constructor source(&logger, &Test_construct::create);
  source.create("#1");
  source.add_attribute("name", "Alice & <friends>");
  source.add_attribute("empty", "");
  source.add_attribute("tricky", "ends with ]]> inside");
  source.add_link("fella", "#2");
  source.create("#2");
  source.add_attribute("first name", "Bob");
  source.add_link("fella", "#1");

  Xml_object_writer writer(&logger);
  tinyxml2::XMLPrinter printer;
  writer.open_document("root", &printer);
  EXPECT_TRUE(writer.document_open());
  writer.open_instruction("person", &printer);
  writer.write_into(*source.find("#1"), &printer);
  writer.open_instruction("robot", &printer); // Closes "person".
  writer.write_into(*source.find("#2"), &printer);
  writer.close_document(&printer);
  EXPECT_FALSE(writer.document_open());

  const string xml(printer.CStr());
  const auto alice_id = writer.id_for(*source.find("#1"));
  const auto bob_id = writer.id_for(*source.find("#2"));
  EXPECT_NE(xml.find('<' + encode_xml_name(alice_id) + '>'), string::npos) << xml;
  EXPECT_NE(xml.find("<first_x0020_name>"), string::npos) << xml;
  EXPECT_NE(xml.find("<![CDATA[Alice & <friends>]]>"), string::npos) << xml;

  Test_constructor target(&logger, &Test_construct::create);
  Test_instructor instructor(&logger, &target);
  instructor.construct_from_string(xml);

  const auto alice = target.find(alice_id);
  const auto bob = target.find(bob_id);
  ASSERT_TRUE(alice) << xml;
  ASSERT_TRUE(bob) << xml;
  EXPECT_EQ(alice->m_instruction, "person");
  EXPECT_EQ(bob->m_instruction, "robot");
  EXPECT_EQ(alice->attributes(), source.find("#1")->attributes());
  EXPECT_EQ(bob->attributes(), source.find("#2")->attributes());
  EXPECT_EQ(alice->link("fella"), bob);
  EXPECT_EQ(bob->link("fella"), alice);
  EXPECT_TRUE(target.unresolved_ids().empty());
} // TEST(Xml_object_writer, Round_trip_with_cycle)

TEST(Xml_object_writer, Document_handling)
{
  Test_logger logger;

  Test_construct solo("");
  solo.set_attribute("name", "Solo");

  // write_into() opens a document on its own, with the configured root name.
  Recording_options opts;
  opts.m_xml_root_name = "recording";
  Xml_object_writer writer(&logger, opts);
  tinyxml2::XMLPrinter printer;
  writer.write_into(solo, &printer);
  EXPECT_TRUE(writer.document_open());

  Error_code err_code;
  writer.open_document("again", &printer, &err_code);
  EXPECT_EQ(err_code, error::Code::S_XML_DOCUMENT_ALREADY_OPEN);
  EXPECT_THROW(writer.open_document("again", &printer), flow::error::Runtime_error);

  writer.close_document(&printer);
  const string xml(printer.CStr());
  EXPECT_EQ(xml.find("<?xml"), 0u) << xml;
  EXPECT_NE(xml.find("<recording>"), string::npos) << xml;
  EXPECT_NE(xml.find("</recording>"), string::npos) << xml;
  EXPECT_EQ(xml.find("again"), string::npos) << xml;

  // Read it back from a file.
  const Temp_file file(xml, ".xml");
  Test_constructor ctor(&logger, &Test_construct::create);
  Test_instructor instructor(&logger, &ctor);
  instructor.construct_from_file(file.path());
  ASSERT_EQ(ctor.constructs().size(), 1u);
  EXPECT_EQ(ctor.constructs().begin()->second->attribute("name"), "Solo");
  EXPECT_EQ(ctor.constructs().begin()->first, writer.id_for(solo));

  Test_constructor ctor2(&logger, &Test_construct::create);
  Test_instructor instructor2(&logger, &ctor2);
  err_code.clear();
  instructor2.construct_from_file("/no/such/dir/no_such_file.xml", &err_code);
  EXPECT_EQ(err_code, error::Code::S_FILE_NOT_FOUND);
} // TEST(Xml_object_writer, Document_handling)

TEST(Xml_object_writer, Unwritable)
{
  Test_logger logger;
  Xml_object_writer writer(&logger);
  tinyxml2::XMLPrinter printer;

  Test_construct target("");
  for (const auto& bad : vector<std::pair<string, string>>{ { "name", "#looks_like_a_link" },
                                                            { "#name", "x" }, { "", "x" } })
  {
    Test_construct writable("");
    writable.set_attribute(bad.first, bad.second);
    Error_code err_code;
    writer.write_into(writable, &printer, &err_code);
    EXPECT_EQ(err_code, error::Code::S_UNWRITABLE_TEXT) << bad.first << '=' << bad.second;
    EXPECT_THROW(writer.write_into(writable, &printer), flow::error::Runtime_error);
  }

  // Link names too.
  {
    Fixed_links_writable writable;
    writable.m_links["#fella"] = &target;
    Error_code err_code;
    writer.write_into(writable, &printer, &err_code);
    EXPECT_EQ(err_code, error::Code::S_UNWRITABLE_TEXT);
  }

  // Nothing at all was written: not even the document was opened.
  EXPECT_FALSE(writer.document_open());
  EXPECT_EQ(string(printer.CStr()), "");

  // A good object afterwards clears the stale code and is written.
  Test_construct good("");
  good.set_attribute("name", "a#b");
  Error_code err_code = error::Code::S_UNWRITABLE_TEXT;
  writer.write_into(good, &printer, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(writer.document_open());
} // TEST(Xml_object_writer, Unwritable)

} // namespace utopia::recording::test
