#include <doctest/doctest.h>

#include "gr4ft/engine/orchestrator.hpp"
#include "gr4ft/engine/resource_resolver.hpp"
#include "test_helpers.hpp"

namespace {

using gr4ft::engine::build_instrumentation_set;
using gr4ft::engine::declared_operations;
using gr4ft::engine::discovery;
using gr4ft::engine::error_code;
using gr4ft::engine::instrumentation_set;
using gr4ft::engine::operation_kind;
using gr4ft::engine::orchestrator;
using gr4ft::engine::orchestrator_options;
using gr4ft::engine::resource_resolver;
using gr4ft::ops::annotation_removal_op;
using gr4ft::ops::copy_op;
using gr4ft::ops::override_op;
using gr4ft::ops::patch_op;
using gr4ft::test_helpers::make_cake_layout;
using gr4ft::test_helpers::make_context;
using gr4ft::test_helpers::temp_tree;

const std::string k_bootstrap = "<?php\n"
                                "require 'paths.php';\n"
                                "Configure::load('app');\n";

const std::string k_bootstrap_patch = "@@ -1,3 +1,4 @@\n"
                                      " <?php\n"
                                      " require 'paths.php';\n"
                                      "+require 'tracer.php';\n"
                                      " Configure::load('app');\n";

// every group touches one file of a small application tree
struct fixture {
  temp_tree tree;
  declared_operations declared;

  fixture() {
    tree.write("app/config/app.php", "<?php return [];\n");
    tree.write("app/config/bootstrap.php", k_bootstrap);
    tree.write("framework/src/Collection.php", "<?php\nclass Collection {\n    #[\\ReturnTypeWillChange]\n    public function current() {}\n}\n");
    tree.write("res/bootstrap.php.patch", k_bootstrap_patch);
    tree.write("res/tracer.php", "<?php // tracer\n");

    declared.overrides.push_back(override_op{tree.at("app/config/app.php"), "<?php return ['tracer' => true];\n"});
    declared.patches.push_back(patch_op{tree.at("res/bootstrap.php.patch"), tree.at("app/config/bootstrap.php")});
    declared.copies.push_back(copy_op{tree.at("res/tracer.php"), tree.at("webroot/tracer.php")});
    declared.annotation_removals.push_back(annotation_removal_op{tree.at("framework/src/Collection.php")});
  }

  instrumentation_set build() const {
    auto set = build_instrumentation_set(declared, discovery{});
    REQUIRE(set.ok());
    return std::move(set.value);
  }
};

} // namespace

TEST_CASE("group sequences are fixed") {
  CHECK(orchestrator::apply_sequence[0] == operation_kind::override_file);
  CHECK(orchestrator::apply_sequence[1] == operation_kind::patch);
  CHECK(orchestrator::apply_sequence[2] == operation_kind::copy);
  CHECK(orchestrator::apply_sequence[3] == operation_kind::annotation_removal);

  CHECK(orchestrator::revert_sequence[0] == operation_kind::annotation_removal);
  CHECK(orchestrator::revert_sequence[1] == operation_kind::override_file);
  CHECK(orchestrator::revert_sequence[2] == operation_kind::patch);
  CHECK(orchestrator::revert_sequence[3] == operation_kind::copy);
}

TEST_CASE("apply then status reports everything applied") {
  fixture env;
  orchestrator runner(env.build(), orchestrator_options{4});

  auto summary = runner.apply();
  CHECK(summary.fully_succeeded());
  REQUIRE(summary.groups.size() == 4);
  for (size_t i = 0; i < summary.groups.size(); ++i) {
    CHECK(summary.groups[i].kind == orchestrator::apply_sequence[i]);
    CHECK(summary.groups[i].processed == 1);
  }

  CHECK(env.tree.read("app/config/app.php") == "<?php return ['tracer' => true];\n");
  CHECK(env.tree.read("app/config/bootstrap.php").find("require 'tracer.php';") != std::string::npos);
  CHECK(env.tree.read("webroot/tracer.php") == "<?php // tracer\n");
  CHECK(env.tree.read("framework/src/Collection.php").find("#[") == std::string::npos);

  auto reports = runner.status();
  REQUIRE(reports.size() == 4);
  for (const auto& report : reports) {
    CHECK(report.applied == 1);
    CHECK(report.unapplied == 0);
  }
}

TEST_CASE("a second apply changes nothing") {
  fixture env;
  orchestrator runner(env.build());

  REQUIRE(runner.apply().fully_succeeded());
  auto after_first = env.tree.snapshot();

  auto again = runner.apply();
  CHECK(again.fully_succeeded());
  CHECK(again.processed_count() == 0);
  for (const auto& group : again.groups) {
    CHECK(group.skipped == 1);
  }
  CHECK(env.tree.snapshot() == after_first);
}

TEST_CASE("revert restores the tree byte for byte") {
  fixture env;
  auto pristine = env.tree.snapshot();
  orchestrator runner(env.build(), orchestrator_options{2});

  REQUIRE(runner.apply().fully_succeeded());
  CHECK(env.tree.snapshot() != pristine);

  auto reverted = runner.revert();
  CHECK(reverted.fully_succeeded());
  REQUIRE(reverted.groups.size() == 4);
  for (size_t i = 0; i < reverted.groups.size(); ++i) {
    CHECK(reverted.groups[i].kind == orchestrator::revert_sequence[i]);
    CHECK(reverted.groups[i].processed == 1);
  }
  CHECK(env.tree.snapshot() == pristine);

  auto reports = runner.status();
  for (const auto& report : reports) {
    CHECK(report.applied == 0);
    CHECK(report.unapplied == 1);
  }

  // nothing left to revert
  auto idle = runner.revert();
  CHECK(idle.fully_succeeded());
  CHECK(idle.processed_count() == 0);
}

TEST_CASE("a failing patch does not stop the other groups") {
  fixture env;
  env.tree.write("app/config/bootstrap.php", "<?php\n// rewritten upstream\n");
  orchestrator runner(env.build());

  auto summary = runner.apply();
  CHECK_FALSE(summary.fully_succeeded());
  CHECK(summary.failure_count() == 1);

  const auto* patches = summary.find(operation_kind::patch);
  REQUIRE(patches != nullptr);
  CHECK(patches->processed == 0);
  REQUIRE(patches->failures.size() == 1);
  CHECK(patches->failures[0].status.code == error_code::mutation_error);
  CHECK(env.tree.read("app/config/bootstrap.php") == "<?php\n// rewritten upstream\n");

  CHECK(summary.find(operation_kind::override_file)->processed == 1);
  CHECK(summary.find(operation_kind::copy)->processed == 1);
  CHECK(summary.find(operation_kind::annotation_removal)->processed == 1);

  auto reports = runner.status();
  CHECK(reports[1].kind == operation_kind::patch);
  CHECK(reports[1].applied == 0);
  CHECK(reports[1].unapplied == 1);
}

TEST_CASE("status never mutates the tree") {
  fixture env;
  auto pristine = env.tree.snapshot();
  orchestrator runner(env.build());

  auto reports = runner.status();
  REQUIRE(reports.size() == 4);
  for (size_t i = 0; i < reports.size(); ++i) {
    CHECK(reports[i].kind == gr4ft::engine::k_declaration_order[i]);
    CHECK(reports[i].applied == 0);
    CHECK(reports[i].unapplied == 1);
  }
  CHECK(env.tree.snapshot() == pristine);
}

TEST_CASE("a stopped orchestrator starts no operations") {
  fixture env;
  auto pristine = env.tree.snapshot();
  orchestrator runner(env.build());

  runner.request_stop();
  auto summary = runner.apply();
  CHECK(summary.cancelled);
  CHECK_FALSE(summary.fully_succeeded());
  REQUIRE(summary.groups.size() == 4);
  CHECK(summary.processed_count() == 0);
  CHECK(env.tree.snapshot() == pristine);
}

TEST_CASE("copy and annotation removal on one file unwind in order") {
  temp_tree tree;
  tree.write("res/Table.php", "<?php\n#[Entity]\nclass Table {}\n");

  declared_operations declared;
  declared.copies.push_back(copy_op{tree.at("res/Table.php"), tree.at("app/Model/Table.php")});
  declared.annotation_removals.push_back(annotation_removal_op{tree.at("app/Model/Table.php")});
  auto set = build_instrumentation_set(declared, discovery{});
  REQUIRE(set.ok());
  orchestrator runner(std::move(set.value));

  REQUIRE(runner.apply().fully_succeeded());
  CHECK(tree.read("app/Model/Table.php") == "<?php\n\nclass Table {}\n");

  auto reverted = runner.revert();
  CHECK(reverted.fully_succeeded());
  CHECK_FALSE(tree.exists("app/Model/Table.php"));
  CHECK(tree.snapshot().size() == 1);
}

TEST_CASE("an empty set reports zero in every group") {
  orchestrator runner(instrumentation_set{});

  auto summary = runner.apply();
  CHECK(summary.fully_succeeded());
  REQUIRE(summary.groups.size() == 4);
  for (const auto& group : summary.groups) {
    CHECK(group.processed == 0);
    CHECK(group.skipped == 0);
  }

  for (const auto& report : runner.status()) {
    CHECK(report.applied == 0);
    CHECK(report.unapplied == 0);
  }
}

TEST_CASE("a declared copy onto a missing destination round trips") {
  temp_tree tree;
  tree.mkdir("webroot");
  declared_operations declared;
  declared.copies.push_back(copy_op{tree.write("conf/stub.php", "<?php // stub\n"), tree.at("webroot/stub.php")});
  auto set = build_instrumentation_set(declared, discovery{});
  REQUIRE(set.ok());
  orchestrator runner(std::move(set.value));

  auto applied = runner.apply();
  CHECK(applied.find(operation_kind::copy)->processed == 1);

  auto reports = runner.status();
  CHECK(reports[2].kind == operation_kind::copy);
  CHECK(reports[2].applied == 1);
  CHECK(reports[2].unapplied == 0);

  auto reverted = runner.revert();
  CHECK(reverted.find(operation_kind::copy)->processed == 1);
  CHECK_FALSE(tree.exists("webroot/stub.php"));
}

TEST_CASE("a discovered patch that fails leaves its neighbour applied") {
  temp_tree tree;
  auto layout = make_cake_layout(tree);
  auto context = make_context(layout);
  REQUIRE(context.ok());

  const std::string application = "<?php\nclass Application extends BaseApplication {}\n";
  const std::string kernel = "<?php\nclass Kernel\n{\n}\n";
  tree.write("project/src/Application.php", application);
  tree.write("project/src/Kernel.php", kernel);
  tree.write(
      "res/cakephp/4/APP_DIR/Application.php.patch", "@@ -1,2 +1,3 @@\n <?php\n+// traced\n class Application {}\n"
  );
  tree.write("res/cakephp/4/APP_DIR/Kernel.php.patch", "@@ -1,2 +1,3 @@\n <?php\n+// traced\n class Kernel\n");

  auto found = resource_resolver(context.value, tree.at("res")).discover();
  REQUIRE(found.patches.size() == 2);
  auto set = build_instrumentation_set(declared_operations{}, found);
  REQUIRE(set.ok());
  orchestrator runner(std::move(set.value), orchestrator_options{2});

  auto summary = runner.apply();
  CHECK(summary.failure_count() == 1);
  const auto* patches = summary.find(operation_kind::patch);
  REQUIRE(patches != nullptr);
  CHECK(patches->processed == 1);
  REQUIRE(patches->failures.size() == 1);
  CHECK(patches->failures[0].status.code == error_code::mutation_error);
  CHECK(patches->failures[0].operation.find("Application.php") != std::string::npos);
  CHECK(tree.read("project/src/Application.php") == application);
  CHECK(tree.read("project/src/Kernel.php") == "<?php\n// traced\nclass Kernel\n{\n}\n");

  auto reports = runner.status();
  CHECK(reports[1].applied == 1);
  CHECK(reports[1].unapplied == 1);

  auto reverted = runner.revert();
  CHECK(reverted.fully_succeeded());
  CHECK(reverted.find(operation_kind::patch)->processed == 1);
  CHECK(tree.read("project/src/Kernel.php") == kernel);
  CHECK(tree.read("project/src/Application.php") == application);
}

TEST_CASE("revert does not touch a file a zero-context deletion never changed") {
  temp_tree tree;
  tree.write("app/list.php", "a\nb\nc\n");
  declared_operations declared;
  declared.patches.push_back(patch_op{tree.write("res/list.php.patch", "@@ -2 +1,0 @@\n-b\n"), tree.at("app/list.php")});
  auto set = build_instrumentation_set(declared, discovery{});
  REQUIRE(set.ok());
  orchestrator runner(std::move(set.value));

  auto before = runner.status();
  CHECK(before[1].applied == 0);
  CHECK(before[1].unapplied == 1);

  auto idle = runner.revert();
  CHECK(idle.fully_succeeded());
  CHECK(idle.processed_count() == 0);
  CHECK(tree.read("app/list.php") == "a\nb\nc\n");

  auto applied = runner.apply();
  CHECK(applied.find(operation_kind::patch)->processed == 1);
  CHECK(tree.read("app/list.php") == "a\nc\n");
  CHECK(runner.status()[1].applied == 1);

  REQUIRE(runner.revert().fully_succeeded());
  CHECK(tree.read("app/list.php") == "a\nb\nc\n");
}

TEST_CASE("annotation removal survives a megabyte line on worker threads") {
  temp_tree tree;
  const std::string blob = "<?php\n$s = '#[" + std::string(1'000'000, 'a') + "';\n#[Pure]\nfunction f() {}\n";
  declared_operations declared;
  declared.annotation_removals.push_back(annotation_removal_op{tree.write("framework/src/Blob.php", blob)});
  declared.annotation_removals.push_back(
      annotation_removal_op{tree.write("framework/src/Small.php", "<?php\n#[Pure] function g() {}\n")}
  );
  auto set = build_instrumentation_set(declared, discovery{});
  REQUIRE(set.ok());
  orchestrator runner(std::move(set.value), orchestrator_options{2});

  auto summary = runner.apply();
  CHECK(summary.fully_succeeded());
  CHECK(summary.find(operation_kind::annotation_removal)->processed == 2);
  CHECK(tree.read("framework/src/Blob.php") == "<?php\n$s = '#[" + std::string(1'000'000, 'a') + "';\n\nfunction f() {}\n");
  CHECK(runner.status()[3].applied == 2);
}
