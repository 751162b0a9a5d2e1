#include "parser.hpp"
#include "json.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace meridian;

namespace
{

  std::string createLine(const std::string &id, const std::string &label)
  {
    return R"({"op":"CREATE","type":"node","id":")" + id + R"(","label":")" + label +
           R"(","set_properties":{"data_source_id":"ds","source_path":"a.txt"}})";
  }

  std::string expectParseError(const std::string &line, uint32_t lineNumber = 1)
  {
    try
    {
      decodeRecord(line, lineNumber, 0);
    }
    catch (const ParseError &e)
    {
      EXPECT_EQ(e.line(), lineNumber);
      return e.what();
    }
    ADD_FAILURE() << "no ParseError for " << line;
    return {};
  }

} // namespace

TEST(Parser, DecodesCreateNode)
{
  Operation op = decodeRecord(createLine("person:00000000000000aa", "person"), 3, 7);
  EXPECT_EQ(op.opKind(), OpKind::Create);
  EXPECT_EQ(op.entityKind(), EntityKind::Node);
  EXPECT_EQ(op.index, 7u);
  EXPECT_EQ(op.span.first, 3u);
  EXPECT_EQ(op.span.last, 3u);
  EXPECT_EQ(op.subject(), "person:00000000000000aa");
  EXPECT_EQ(op.label(), "person");

  const auto &c = std::get<CreateOp>(op.body);
  ASSERT_TRUE(c.setProperties.has_value());
  const Property *ds = findProperty(*c.setProperties, "data_source_id");
  ASSERT_NE(ds, nullptr);
  EXPECT_EQ(std::get<std::string>(ds->val), "ds");
  EXPECT_TRUE(op.unknownFields.empty());
}

TEST(Parser, OpAndTypeMatchExactly)
{
  Operation op = decodeRecord(R"({"op":"DELETE","type":"edge","id":"knows:0000000000000001"})", 1, 0);
  EXPECT_EQ(op.opKind(), OpKind::Delete);
  EXPECT_EQ(op.entityKind(), EntityKind::Edge);

  EXPECT_EQ(expectParseError(R"({"op":"create","type":"node","id":"x"})"), "Line 1: unknown op 'create'");
  EXPECT_EQ(expectParseError(R"({"op":"Delete","type":"node","id":"x"})", 2), "Line 2: unknown op 'Delete'");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","type":"NODE","id":"x"})"), "Line 1: 'type' must be \"node\" or \"edge\", got 'NODE'");
}

TEST(Parser, UnicodeEscapesDecodeToUtf8)
{
  Operation op = decodeRecord(R"({"op":"UPDATE","type":"node","id":"x","set_properties":{"name":"\u4e2d\u6587","smile":"\ud83d\ude00","accent":"caf\u00e9","raw":"中"}})", 1, 0);
  const auto &p = *std::get<UpdateOp>(op.body).setProperties;
  EXPECT_EQ(std::get<std::string>(findProperty(p, "name")->val), "\xE4\xB8\xAD\xE6\x96\x87");
  EXPECT_EQ(std::get<std::string>(findProperty(p, "smile")->val), "\xF0\x9F\x98\x80");
  EXPECT_EQ(std::get<std::string>(findProperty(p, "accent")->val), "caf\xC3\xA9");
  EXPECT_EQ(std::get<std::string>(findProperty(p, "raw")->val), "\xE4\xB8\xAD");
}

TEST(Parser, EscapedNulIsKept)
{
  Operation op = decodeRecord(R"({"op":"CREATE","type":"node","id":"a\u0000b","set_properties":{"v":"x\u0000"}})", 1, 0);
  const auto &c = std::get<CreateOp>(op.body);
  ASSERT_TRUE(c.id.has_value());
  EXPECT_EQ(*c.id, std::string("a\0b", 3));
  EXPECT_EQ(std::get<std::string>(findProperty(*c.setProperties, "v")->val), std::string("x\0", 2));
  EXPECT_EQ(json::quote(*c.id), R"("a\u0000b")");
}

TEST(Parser, EscapedKeysAreDecoded)
{
  Operation op = decodeRecord(R"({"op":"UPDATE","type":"node","\u0069d":"x","set_properties":{"caf\u00e9":1}})", 1, 0);
  const auto &u = std::get<UpdateOp>(op.body);
  EXPECT_EQ(u.id.value_or(""), "x");
  ASSERT_EQ(u.setProperties->size(), 1u);
  EXPECT_EQ(u.setProperties->front().key, "caf\xC3\xA9");
  EXPECT_TRUE(op.unknownFields.empty());
}

TEST(Parser, UndecodableStringsRaiseParseError)
{
  EXPECT_EQ(expectParseError(R"({"op":"UPDATE","type":"node","id":"x","set_properties":{"name":"\ud83d"}})"),
            R"(Line 1: field 'set_properties': invalid string "\ud83d")");
  EXPECT_EQ(expectParseError(R"({"op":"UPDATE","type":"node","id":"x","set_properties":{"\ude00":1}})", 3),
            R"(Line 3: field 'set_properties': invalid object key "\ude00")");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","type":"node","id":"\u12"})"), "Line 1: field 'id' holds an invalid string");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","type":"node","\x":1})"), R"(Line 1: invalid object key "\x")");

  ParsedBatch batch = parseBatch(createLine("a", "person") + "\n" +
                                 R"({"op":"UPDATE","type":"node","id":"a","set_properties":{"name":"\udc00x"}})");
  ASSERT_EQ(batch.errors.size(), 1u);
  EXPECT_EQ(batch.errors[0].line, 2u);
  EXPECT_EQ(batch.operations.size(), 1u);
}

TEST(Parser, PropertyValueTypes)
{
  Operation op = decodeRecord(R"({"op":"UPDATE","type":"node","id":"x","set_properties":{"i":42,"neg":-7,"f":1.5,"e":2e3,"b":true,"s":"hi\n","n":null,"arr":[1,2],"obj":{"k":"v"}}})", 1, 0);
  const auto &u = std::get<UpdateOp>(op.body);
  ASSERT_TRUE(u.setProperties.has_value());
  const auto &p = *u.setProperties;
  ASSERT_EQ(p.size(), 9u);
  EXPECT_EQ(std::get<int64_t>(findProperty(p, "i")->val), 42);
  EXPECT_EQ(std::get<int64_t>(findProperty(p, "neg")->val), -7);
  EXPECT_DOUBLE_EQ(std::get<double>(findProperty(p, "f")->val), 1.5);
  EXPECT_DOUBLE_EQ(std::get<double>(findProperty(p, "e")->val), 2000.0);
  EXPECT_TRUE(std::get<bool>(findProperty(p, "b")->val));
  EXPECT_EQ(std::get<std::string>(findProperty(p, "s")->val), "hi\n");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(findProperty(p, "n")->val));
  EXPECT_EQ(std::get<JsonText>(findProperty(p, "arr")->val).raw, "[1,2]");
  EXPECT_EQ(std::get<JsonText>(findProperty(p, "obj")->val).raw, R"({"k":"v"})");
}

TEST(Parser, DefineCarriesPropertyLists)
{
  Operation op = decodeRecord(R"({"op":"DEFINE","type":"node","label":"person","description":"A human","required_properties":["name"],"optional_properties":["age","email"]})", 1, 0);
  const auto &d = std::get<DefineOp>(op.body);
  EXPECT_EQ(d.label.value_or(""), "person");
  EXPECT_EQ(d.description.value_or(""), "A human");
  EXPECT_EQ(d.requiredProperties, std::vector<std::string>{"name"});
  EXPECT_EQ(d.optionalProperties, (std::vector<std::string>{"age", "email"}));
  EXPECT_EQ(op.subject(), "person");
}

TEST(Parser, DefineCarriesExampleFields)
{
  Operation op = decodeRecord(R"json({"op":"DEFINE","type":"node","label":"person","description":"A human","example_file_path":"people/ada.md","example_in_file_path":"Ada Lovelace (1815)","required_properties":["name"]})json", 1, 0);
  const auto &d = std::get<DefineOp>(op.body);
  EXPECT_EQ(d.exampleFilePath.value_or(""), "people/ada.md");
  EXPECT_EQ(d.exampleInFilePath.value_or(""), "Ada Lovelace (1815)");
  EXPECT_TRUE(op.unknownFields.empty());

  Operation create = decodeRecord(R"({"op":"CREATE","type":"node","id":"x","example_file_path":"a.md"})", 1, 0);
  EXPECT_EQ(create.unknownFields, std::vector<std::string>{"example_file_path"});
}

TEST(Parser, MalformedRecordsRaiseParseError)
{
  EXPECT_EQ(expectParseError(R"({"op":"CREATE",)", 4), "Line 4: invalid syntax");
  EXPECT_EQ(expectParseError("[1,2,3]"), "Line 1: invalid syntax");
  EXPECT_EQ(expectParseError(R"({"type":"node","id":"x"})"), "Line 1: missing 'op'");
  EXPECT_EQ(expectParseError(R"({"op":"MERGE","type":"node"})"), "Line 1: unknown op 'MERGE'");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","id":"x"})"), "Line 1: missing 'type'");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","type":"vertex"})"), "Line 1: 'type' must be \"node\" or \"edge\", got 'vertex'");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","type":"node","id":5})"), "Line 1: field 'id' must be a string");
  EXPECT_EQ(expectParseError(R"({"op":"UPDATE","type":"node","id":"x","remove_properties":"a"})"), "Line 1: field 'remove_properties' must be a list of strings");
  EXPECT_EQ(expectParseError(R"({"op":"CREATE","type":"node","set_properties":[1]})"), "Line 1: field 'set_properties' must be an object");
}

TEST(Parser, NullFieldsCountAsAbsent)
{
  Operation op = decodeRecord(R"({"op":"CREATE","type":"node","id":null,"label":"person"})", 1, 0);
  const auto &c = std::get<CreateOp>(op.body);
  EXPECT_FALSE(c.id.has_value());
  EXPECT_FALSE(c.setProperties.has_value());
}

TEST(Parser, RecordsUnknownFields)
{
  Operation op = decodeRecord(R"({"op":"DELETE","type":"node","id":"x","label":"person","why":1})", 1, 0);
  EXPECT_EQ(op.unknownFields, (std::vector<std::string>{"label", "why"}));
}

TEST(Parser, SkipsBlankAndCommentLines)
{
  std::string text = "\n// header comment\n# another\n   \n" + createLine("a", "person") + "\r\n\n" + createLine("b", "person") + "\n";
  std::vector<uint32_t> lines;
  forEachRecordLine(text, [&](uint32_t n, std::string_view)
                    { lines.push_back(n); });
  EXPECT_EQ(lines, (std::vector<uint32_t>{5, 7}));

  ParsedBatch batch = parseBatch(text);
  EXPECT_TRUE(batch.ok());
  ASSERT_EQ(batch.operations.size(), 2u);
  EXPECT_EQ(batch.operations[0].op.span.first, 5u);
  EXPECT_EQ(batch.operations[1].op.span.first, 7u);
}

TEST(Parser, UnparsableLineFiveOfTen)
{
  std::string text;
  for (int i = 1; i <= 10; ++i)
  {
    if (i == 5)
      text += "{\"op\":\"CREATE\", this is not json\n";
    else
      text += createLine("person:" + std::string(15, '0') + std::to_string(i % 10), "person") + "\n";
  }

  ParsedBatch batch = parseBatch(text);
  EXPECT_EQ(batch.operations.size(), 9u);
  ASSERT_EQ(batch.errors.size(), 1u);
  EXPECT_EQ(batch.errors[0].kind, ErrorKind::Parse);
  EXPECT_EQ(batch.errors[0].line, 5u);
  EXPECT_EQ(batch.errors[0].message, "Line 5: invalid syntax");
  EXPECT_FALSE(batch.ok());

  // indexes count decoded operations only
  EXPECT_EQ(batch.operations[4].op.index, 4u);
  EXPECT_EQ(batch.operations[4].op.span.first, 6u);
}

TEST(Parser, DuplicateKeyKeepsLastValue)
{
  Operation op = decodeRecord(R"({"op":"DELETE","type":"node","id":"first","id":"second"})", 1, 0);
  EXPECT_EQ(op.subject(), "second");
}
