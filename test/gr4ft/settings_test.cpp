#include <doctest/doctest.h>

#include "gr4ft/settings/settings.hpp"
#include "test_helpers.hpp"

namespace {

using gr4ft::engine::error_code;
using gr4ft::settings::load_settings;
using gr4ft::settings::load_settings_source;
using gr4ft::test_helpers::make_cake_layout;
using gr4ft::test_helpers::make_context;
using gr4ft::test_helpers::temp_tree;

} // namespace

TEST_CASE("missing settings script is a configuration error") {
  temp_tree tree;
  auto layout = make_cake_layout(tree);
  auto context = make_context(layout);
  REQUIRE(context.ok());

  auto loaded = load_settings(tree.at("conf/missing.lua"), context.value);
  CHECK(loaded.status.code == error_code::configuration_error);
}

#ifdef GR4FT_HAS_SCRIPTING

TEST_CASE("settings script declares every group") {
  temp_tree tree;
  auto layout = make_cake_layout(tree);
  auto context = make_context(layout);
  REQUIRE(context.ok());
  tree.write("conf/overrides/index.php", "<?php // traced index\n");

  auto loaded = load_settings_source(
      R"lua(
patch_dir = "resources"
overrides = {
  { path = target.app_dir .. "/config/app.php", content = "<?php return [];\n" },
  { path = gr4ft.join(target.webroot_dir, "index.php"), source = "overrides/index.php" },
}
patches = {
  { patch = "patches/bootstrap.patch", original = target.app_dir .. "/config/bootstrap.php" },
}
copies = {
  { src = "/opt/tracer/tracer.php", dst = target.webroot_dir .. "/tracer.php" },
}
remove_annotations = {
  { path = target.framework_dir .. "/src/Collection.php" },
  { path = target.framework_dir .. "/src/Entity.php", pattern = "@deprecated" },
}
)lua",
      tree.at("conf"), context.value
  );
  REQUIRE(loaded.ok());

  const auto& settings = loaded.value;
  CHECK(settings.patch_dir == tree.at("conf/resources"));

  REQUIRE(settings.declared.overrides.size() == 2);
  CHECK(settings.declared.overrides[0].target == layout.app / "config" / "app.php");
  CHECK(settings.declared.overrides[0].content == "<?php return [];\n");
  CHECK(settings.declared.overrides[1].target == layout.webroot / "index.php");
  CHECK(settings.declared.overrides[1].content == "<?php // traced index\n");

  REQUIRE(settings.declared.patches.size() == 1);
  CHECK(settings.declared.patches[0].patch_file == tree.at("conf/patches/bootstrap.patch"));
  CHECK(settings.declared.patches[0].original_file == layout.app / "config" / "bootstrap.php");

  REQUIRE(settings.declared.copies.size() == 1);
  CHECK(settings.declared.copies[0].source == std::filesystem::path("/opt/tracer/tracer.php"));
  CHECK(settings.declared.copies[0].destination == layout.webroot / "tracer.php");

  REQUIRE(settings.declared.annotation_removals.size() == 2);
  CHECK(settings.declared.annotation_removals[0].annotation_pattern == gr4ft::ops::k_default_annotation_pattern);
  CHECK(settings.declared.annotation_removals[1].annotation_pattern == "@deprecated");
}

TEST_CASE("settings script sees the target") {
  temp_tree tree;
  auto layout = make_cake_layout(tree, "4.2.0");
  auto context = make_context(layout, "4.2.0");
  REQUIRE(context.ok());

  auto loaded = load_settings_source(
      R"lua(patch_dir = "res/" .. target.major_version .. "/" .. target.version)lua", tree.at("conf"), context.value
  );
  REQUIRE(loaded.ok());
  CHECK(loaded.value.patch_dir == tree.at("conf/res/4/4.2.0"));
}

TEST_CASE("settings load from a file resolves resources beside it") {
  temp_tree tree;
  auto layout = make_cake_layout(tree);
  auto context = make_context(layout);
  REQUIRE(context.ok());
  auto script = tree.write("conf/settings.lua", "patch_dir = 'resources'\n");

  auto loaded = load_settings(script, context.value);
  REQUIRE(loaded.ok());
  CHECK(loaded.value.patch_dir == tree.at("conf/resources"));
  CHECK(loaded.value.declared.overrides.empty());
}

TEST_CASE("settings script errors are configuration errors") {
  temp_tree tree;
  auto layout = make_cake_layout(tree);
  auto context = make_context(layout);
  REQUIRE(context.ok());
  auto dir = tree.at("conf");

  SUBCASE("syntax error") {
    CHECK(load_settings_source("patch_dir = ", dir, context.value).status.code == error_code::configuration_error);
  }
  SUBCASE("target is read-only") {
    CHECK(load_settings_source("target.version = '9.0.0'", dir, context.value).status.code ==
          error_code::configuration_error);
  }
  SUBCASE("relative target path") {
    auto loaded = load_settings_source("overrides = { { path = 'config/app.php', content = 'x' } }", dir, context.value);
    CHECK(loaded.status.code == error_code::configuration_error);
  }
  SUBCASE("override needs exactly one body") {
    auto both = load_settings_source(
        "overrides = { { path = '/srv/a.php', content = 'x', source = 'a.php' } }", dir, context.value
    );
    CHECK(both.status.code == error_code::configuration_error);
    auto neither = load_settings_source("overrides = { { path = '/srv/a.php' } }", dir, context.value);
    CHECK(neither.status.code == error_code::configuration_error);
  }
  SUBCASE("wrong shapes") {
    CHECK(load_settings_source("copies = 'tracer.php'", dir, context.value).status.code ==
          error_code::configuration_error);
    CHECK(load_settings_source("patches = { 'x.patch' }", dir, context.value).status.code ==
          error_code::configuration_error);
    CHECK(load_settings_source("patch_dir = 4", dir, context.value).status.code == error_code::configuration_error);
  }
}

#else

TEST_CASE("settings scripts are unsupported without scripting") {
  temp_tree tree;
  auto layout = make_cake_layout(tree);
  auto context = make_context(layout);
  REQUIRE(context.ok());

  auto loaded = load_settings_source("patch_dir = 'resources'", tree.at("conf"), context.value);
  CHECK(loaded.status.code == error_code::unsupported);
}

#endif
