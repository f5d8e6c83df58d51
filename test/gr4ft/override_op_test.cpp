#include <doctest/doctest.h>

#include "gr4ft/ops/override_op.hpp"
#include "test_helpers.hpp"

namespace {

using gr4ft::engine::check_state;
using gr4ft::ops::override_op;
using gr4ft::test_helpers::temp_tree;

} // namespace

TEST_CASE("override replaces and restores contents") {
  temp_tree tree;
  auto target = tree.write("app/config/app.php", "<?php return ['debug' => false];\n");
  override_op op{target, "<?php return ['debug' => true];\n"};

  CHECK(op.check() == check_state::not_applied);
  REQUIRE(op.apply().ok());
  CHECK(tree.read("app/config/app.php") == "<?php return ['debug' => true];\n");
  CHECK(op.check() == check_state::applied);

  REQUIRE(op.revert().ok());
  CHECK(tree.read("app/config/app.php") == "<?php return ['debug' => false];\n");
  CHECK(op.check() == check_state::not_applied);
  CHECK_FALSE(tree.exists("app/config/app.php.gr4ft.overrides.orig"));
}

TEST_CASE("override of a missing file is removed on revert") {
  temp_tree tree;
  override_op op{tree.at("app/config/tracer.php"), "<?php\n"};

  REQUIRE(op.apply().ok());
  CHECK(tree.read("app/config/tracer.php") == "<?php\n");
  CHECK(op.check() == check_state::applied);

  REQUIRE(op.revert().ok());
  CHECK_FALSE(tree.exists("app/config/tracer.php"));
  CHECK(tree.snapshot().empty());
}

TEST_CASE("override drifted after apply reads as not applied") {
  temp_tree tree;
  auto target = tree.write("app/bootstrap.php", "original");
  override_op op{target, "replacement"};

  REQUIRE(op.apply().ok());
  tree.write("app/bootstrap.php", "edited by hand");
  CHECK(op.check() == check_state::not_applied);

  // re-applying keeps the first recorded original
  REQUIRE(op.apply().ok());
  REQUIRE(op.revert().ok());
  CHECK(tree.read("app/bootstrap.php") == "original");
}

TEST_CASE("override describe names the target") {
  override_op op{"/srv/app/src/Application.php", ""};
  CHECK(op.describe().find("/srv/app/src/Application.php") != std::string::npos);
}
