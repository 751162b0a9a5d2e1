#include "lint.hpp"
#include "parser.hpp"
#include "schema_registry.hpp"
#include "validator.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace meridian;

namespace
{

  const char *kPersonCreate =
      R"({"op":"CREATE","type":"node","id":"person:0123456789abcdef","label":"person","set_properties":{"data_source_id":"ds1","source_path":"notes/a.md","name":"Ada"}})";

  bool hasWarning(const ParsedOperation &po, const std::string &w)
  {
    return std::find(po.warnings.begin(), po.warnings.end(), w) != po.warnings.end();
  }

} // namespace

TEST(Validator, CanonicalIds)
{
  EXPECT_TRUE(isCanonicalId("person:0123456789abcdef"));
  EXPECT_TRUE(isCanonicalId("works_at:00000000000000ff"));
  EXPECT_FALSE(isCanonicalId("person:0123456789ABCDEF"));
  EXPECT_FALSE(isCanonicalId("person:0123"));
  EXPECT_FALSE(isCanonicalId(":0123456789abcdef"));
  EXPECT_FALSE(isCanonicalId("Person:0123456789abcdef"));
  EXPECT_FALSE(isCanonicalId("alice"));
  EXPECT_EQ(idPrefix("person:0123456789abcdef"), "person");
  EXPECT_EQ(idPrefix("alice"), "alice");
}

TEST(Validator, UndefinedLabelIsOnlyWarning)
{
  SchemaRegistry registry;
  ParsedBatch batch = lintText(kPersonCreate, &registry);
  EXPECT_TRUE(batch.ok());
  ASSERT_EQ(batch.operations.size(), 1u);
  EXPECT_EQ(batch.operations[0].op.opKind(), OpKind::Create);
  EXPECT_EQ(batch.warningCount(), 1u);
  EXPECT_EQ(batch.operations[0].warnings[0], "label 'person' undefined");
}

TEST(Validator, NoRegistrySkipsUndefinedLabel)
{
  ParsedBatch batch = lintText(kPersonCreate, nullptr);
  EXPECT_TRUE(batch.ok());
  EXPECT_EQ(batch.warningCount(), 0u);
}

TEST(Validator, MissingProvenanceIsStructural)
{
  ParsedBatch batch = lintText(
      "\n" R"({"op":"CREATE","type":"node","id":"person:0123456789abcdef","label":"person","set_properties":{"source_path":"a"}})",
      nullptr);
  ASSERT_EQ(batch.errors.size(), 1u);
  EXPECT_EQ(batch.errors[0].kind, ErrorKind::Structural);
  EXPECT_EQ(batch.errors[0].line, 2u);
  EXPECT_EQ(batch.errors[0].index.value_or(99), 0u);
  EXPECT_EQ(batch.errors[0].message, "Line 2 (operation 0): CREATE set_properties is missing 'data_source_id'");

  batch = lintText(R"({"op":"CREATE","type":"node","id":"person:0123456789abcdef","label":"person"})", nullptr);
  ASSERT_EQ(batch.errors.size(), 1u);
  EXPECT_EQ(batch.errors[0].message,
            "Line 1 (operation 0): CREATE is missing 'set_properties' with 'data_source_id' and 'source_path'");
}

TEST(Validator, StructuralProblemsPerVariant)
{
  ParsedBatch batch = parseBatch(
      R"({"op":"CREATE","type":"edge","label":"knows","set_properties":{"data_source_id":"d","source_path":"p"}})"
      "\n" R"({"op":"UPDATE","type":"node","set_properties":{"a":1}})"
      "\n" R"({"op":"DELETE","type":"node"})"
      "\n" R"({"op":"DEFINE","type":"node","description":"no label"})");
  ASSERT_TRUE(batch.ok());
  ASSERT_EQ(batch.operations.size(), 4u);

  EXPECT_EQ(structuralProblems(batch.operations[0].op),
            (std::vector<std::string>{"CREATE is missing 'id'", "CREATE edge requires 'start_id' and 'end_id'"}));
  EXPECT_EQ(structuralProblems(batch.operations[1].op), std::vector<std::string>{"UPDATE is missing 'id'"});
  EXPECT_EQ(structuralProblems(batch.operations[2].op), std::vector<std::string>{"DELETE is missing 'id'"});
  EXPECT_EQ(structuralProblems(batch.operations[3].op), std::vector<std::string>{"DEFINE is missing 'label'"});

  validate(batch, nullptr);
  EXPECT_EQ(batch.errors.size(), 5u);
  for (const auto &e : batch.errors)
    EXPECT_EQ(e.kind, ErrorKind::Structural);
  EXPECT_EQ(batch.errors.back().line, 4u);
}

TEST(Validator, ErrorsSortedByLine)
{
  ParsedBatch batch = lintText(
      R"({"op":"DELETE","type":"node"})"
      "\nnot json\n" R"({"op":"UPDATE","type":"node"})",
      nullptr);
  ASSERT_EQ(batch.errors.size(), 3u);
  EXPECT_EQ(batch.errors[0].line, 1u);
  EXPECT_EQ(batch.errors[0].kind, ErrorKind::Structural);
  EXPECT_EQ(batch.errors[1].line, 2u);
  EXPECT_EQ(batch.errors[1].kind, ErrorKind::Parse);
  EXPECT_EQ(batch.errors[2].line, 3u);
  EXPECT_EQ(batch.errors[2].index.value_or(99), 1u);
}

TEST(Validator, RevalidationIsStable)
{
  SchemaRegistry registry;
  ParsedBatch batch = lintText(std::string(kPersonCreate) + "\n" + R"({"op":"DELETE","type":"node"})", &registry);
  auto errors = batch.errors.size();
  auto warnings = batch.warningCount();
  validate(batch, &registry);
  validate(batch, &registry);
  EXPECT_EQ(batch.errors.size(), errors);
  EXPECT_EQ(batch.warningCount(), warnings);
}

TEST(Validator, RequiredPropertiesFromBatchDefine)
{
  SchemaRegistry registry;
  ParsedBatch batch = lintText(
      std::string(kPersonCreate) + "\n" +
          R"({"op":"DEFINE","type":"node","label":"person","description":"A human","required_properties":["name","born"]})",
      &registry);
  EXPECT_TRUE(batch.ok());
  ASSERT_EQ(batch.operations.size(), 2u);
  EXPECT_EQ(batch.operations[0].warnings, std::vector<std::string>{"missing required property 'born' for node 'person'"});
  EXPECT_TRUE(batch.operations[1].warnings.empty());
}

TEST(Validator, BatchDefineOverridesRegistry)
{
  SchemaRegistry registry;
  registry.upsert(TypeDefinition{EntityKind::Node, "person", "old", {"ssn"}, {}});

  ParsedBatch withRegistry = lintText(kPersonCreate, &registry);
  ASSERT_EQ(withRegistry.operations.size(), 1u);
  EXPECT_TRUE(hasWarning(withRegistry.operations[0], "missing required property 'ssn' for node 'person'"));

  ParsedBatch overridden = lintText(
      std::string(R"({"op":"DEFINE","type":"node","label":"person","description":"new","required_properties":["name"]})") + "\n" + kPersonCreate,
      &registry);
  EXPECT_EQ(overridden.warningCount(), 0u);
}

TEST(Validator, EdgeLabelsAreSeparateFromNodeLabels)
{
  SchemaRegistry registry;
  registry.upsert(TypeDefinition{EntityKind::Edge, "person", "", {}, {}});
  ParsedBatch batch = lintText(kPersonCreate, &registry);
  EXPECT_TRUE(hasWarning(batch.operations[0], "label 'person' undefined"));
}

TEST(Validator, IdShapeWarnings)
{
  ParsedBatch batch = lintText(
      R"({"op":"CREATE","type":"edge","id":"knows:0000000000000001","label":"likes","start_id":"alice","end_id":"person:0000000000000002","set_properties":{"data_source_id":"d","source_path":"p"}})",
      nullptr);
  EXPECT_TRUE(batch.ok());
  const auto &po = batch.operations[0];
  EXPECT_TRUE(hasWarning(po, "id prefix 'knows' does not match label 'likes'"));
  EXPECT_TRUE(hasWarning(po, "start_id 'alice' is not in canonical form '<label>:<16 hex digits>'"));
  EXPECT_EQ(po.warnings.size(), 2u);
}

TEST(Validator, NodeEndpointsIgnored)
{
  ParsedBatch batch = lintText(
      R"({"op":"CREATE","type":"node","id":"person:0123456789abcdef","label":"person","start_id":"x","set_properties":{"data_source_id":"d","source_path":"p"}})",
      nullptr);
  EXPECT_TRUE(batch.ok());
  EXPECT_EQ(batch.operations[0].warnings, std::vector<std::string>{"start_id/end_id are ignored for nodes"});
}

TEST(Validator, UpdateWarnings)
{
  ParsedBatch batch = lintText(
      R"({"op":"UPDATE","type":"node","id":"person:0123456789abcdef"})"
      "\n" R"({"op":"UPDATE","type":"node","id":"person:0123456789abcdef","set_properties":{"a":1,"b":2},"remove_properties":["a"]})",
      nullptr);
  EXPECT_TRUE(batch.ok());
  ASSERT_EQ(batch.operations.size(), 2u);
  EXPECT_EQ(batch.operations[0].warnings, std::vector<std::string>{"UPDATE has no set_properties or remove_properties"});
  EXPECT_EQ(batch.operations[1].warnings, std::vector<std::string>{"property 'a' is both set and removed; remove wins"});
}

TEST(Validator, DefineAndUnknownFieldWarnings)
{
  ParsedBatch batch = lintText(R"({"op":"DEFINE","type":"node","label":"person","colour":"red"})", nullptr);
  EXPECT_TRUE(batch.ok());
  EXPECT_EQ(batch.operations[0].warnings,
            (std::vector<std::string>{"DEFINE has no description", "unknown field 'colour' for DEFINE"}));
}
