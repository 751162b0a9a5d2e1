#include "env.hpp"
#include "schema_registry.hpp"
#include "store.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>

using namespace meridian;

TEST(SchemaRegistry, UpsertFindAndReplace)
{
  SchemaRegistry registry;
  EXPECT_FALSE(registry.contains(EntityKind::Node, "person"));

  registry.upsert(TypeDefinition{EntityKind::Node, "person", "v1", {"name"}, {}});
  registry.upsert(TypeDefinition{EntityKind::Node, "person", "v2", {"name", "born"}, {"age"}});
  ASSERT_TRUE(registry.contains(EntityKind::Node, "person"));
  EXPECT_FALSE(registry.contains(EntityKind::Edge, "person"));

  auto def = registry.find(EntityKind::Node, "person");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->description, "v2");
  EXPECT_EQ(def->requiredProperties.size(), 2u);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(SchemaRegistry, ListAndLabelPrefix)
{
  SchemaRegistry registry;
  registry.upsert(TypeDefinition{EntityKind::Node, "person", "", {}, {}});
  registry.upsert(TypeDefinition{EntityKind::Node, "place", "", {}, {}});
  registry.upsert(TypeDefinition{EntityKind::Node, "company", "", {}, {}});
  registry.upsert(TypeDefinition{EntityKind::Edge, "person_of", "", {}, {}});

  EXPECT_EQ(registry.list().size(), 4u);
  auto nodes = registry.list(EntityKind::Node);
  ASSERT_EQ(nodes.size(), 3u);
  EXPECT_EQ(nodes[0].label, "company");
  EXPECT_EQ(nodes[2].label, "place");

  EXPECT_EQ(registry.labels(EntityKind::Node, "p"), (std::vector<std::string>{"person", "place"}));
  EXPECT_EQ(registry.labels(EntityKind::Node, "pe"), std::vector<std::string>{"person"});
  EXPECT_EQ(registry.labels(EntityKind::Edge), std::vector<std::string>{"person_of"});
  EXPECT_TRUE(registry.labels(EntityKind::Node, "z").empty());
}

TEST(SchemaRegistry, RegistriesAreIndependent)
{
  SchemaRegistry a;
  SchemaRegistry b;
  a.upsert(TypeDefinition{EntityKind::Node, "person", "", {}, {}});
  EXPECT_TRUE(a.contains(EntityKind::Node, "person"));
  EXPECT_FALSE(b.contains(EntityKind::Node, "person"));
}

TEST(SchemaRegistry, LoadsFromStore)
{
  meridian::test_support::TempDir dir("meridian-registry-test-");
  Env env(dir.path, size_t(64) << 20);
  Store store(env);
  {
    Txn tx = store.beginWrite();
    store.putTypeDefinition(tx, TypeDefinition{EntityKind::Node, "person", "A human", {"name"}, {}});
    store.putTypeDefinition(tx, TypeDefinition{EntityKind::Edge, "knows", "", {}, {}});
    tx.commit();
  }

  SchemaRegistry registry;
  registry.upsert(TypeDefinition{EntityKind::Node, "stale", "", {}, {}});
  EXPECT_EQ(registry.loadFrom(store), 2u);
  EXPECT_FALSE(registry.contains(EntityKind::Node, "stale"));
  auto person = registry.find(EntityKind::Node, "person");
  ASSERT_TRUE(person.has_value());
  EXPECT_EQ(person->description, "A human");
  EXPECT_TRUE(registry.contains(EntityKind::Edge, "knows"));
}
