#include "instrument.hpp"
#include <redlog.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace gr4ftx::commands {

namespace {

std::atomic<gr4ft::session*> g_active_session{nullptr};

void handle_interrupt(int) {
  if (auto* active = g_active_session.load()) {
    active->request_stop();
  }
}

// publishes the session to the interrupt handler for the duration of a run
class interrupt_scope {
public:
  explicit interrupt_scope(gr4ft::session& active) {
    g_active_session.store(&active);
    previous_ = std::signal(SIGINT, handle_interrupt);
  }
  ~interrupt_scope() {
    std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
    g_active_session.store(nullptr);
  }

  interrupt_scope(const interrupt_scope&) = delete;
  interrupt_scope& operator=(const interrupt_scope&) = delete;

private:
  void (*previous_)(int) = SIG_DFL;
};

std::string display_name(gr4ft::engine::operation_kind kind) {
  switch (kind) {
  case gr4ft::engine::operation_kind::override_file:
    return "Overrides";
  case gr4ft::engine::operation_kind::patch:
    return "Patches";
  case gr4ft::engine::operation_kind::copy:
    return "Copies";
  case gr4ft::engine::operation_kind::annotation_removal:
    return "Annotations";
  }
  return "Unknown";
}

std::unique_ptr<gr4ft::session> open_session(const gr4ft::session_options& options) {
  auto log = redlog::get_logger("gr4ftx.session");
  auto opened = gr4ft::session::open(options);
  if (!opened.ok()) {
    log.err(
        "cannot prepare instrumentation", redlog::field("code", gr4ft::engine::error_code_name(opened.status.code)),
        redlog::field("error", opened.status.message)
    );
    std::cerr << "error: " << opened.status.message << std::endl;
    return nullptr;
  }
  return std::move(opened.value);
}

void print_failures(const gr4ft::engine::run_summary& summary, std::ostream& out) {
  if (summary.failure_count() == 0) {
    return;
  }

  out << "Failures: " << summary.failure_count() << std::endl;
  for (const auto& failure : summary.resolution_failures) {
    out << "  [" << gr4ft::engine::error_code_name(failure.status.code) << "] " << failure.operation << ": "
        << failure.status.message << std::endl;
  }
  for (const auto& group : summary.groups) {
    for (const auto& failure : group.failures) {
      out << "  [" << gr4ft::engine::error_code_name(failure.status.code) << "] " << failure.operation << ": "
          << failure.status.message << std::endl;
    }
  }
}

int finish(const gr4ft::engine::run_summary& summary, std::ostream& out) {
  print_failures(summary, out);
  if (summary.cancelled) {
    out << "Interrupted before all groups ran" << std::endl;
  }
  return static_cast<int>(summary.fully_succeeded() ? exit_status::ok : exit_status::partial);
}

} // namespace

int apply(const gr4ft::session_options& options, std::ostream& out) {
  auto active = open_session(options);
  if (!active) {
    return static_cast<int>(exit_status::fatal);
  }

  gr4ft::engine::run_summary summary;
  {
    interrupt_scope scope(*active);
    summary = active->apply();
  }

  static constexpr const char* k_labels[] = {
      "Overrides Applied", "Patches Applied", "Copies Applied", "Annotations Removed"
  };
  for (const auto& group : summary.groups) {
    out << k_labels[gr4ft::engine::group_index(group.kind)] << " " << group.processed << std::endl;
  }
  return finish(summary, out);
}

int revert(const gr4ft::session_options& options, std::ostream& out) {
  auto active = open_session(options);
  if (!active) {
    return static_cast<int>(exit_status::fatal);
  }

  gr4ft::engine::run_summary summary;
  {
    interrupt_scope scope(*active);
    summary = active->revert();
  }

  for (const auto& group : summary.groups) {
    out << display_name(group.kind) << " Reverted " << group.processed << std::endl;
  }
  return finish(summary, out);
}

int status(const gr4ft::session_options& options, std::ostream& out) {
  auto active = open_session(options);
  if (!active) {
    return static_cast<int>(exit_status::fatal);
  }

  out << "Applied / Unapplied" << std::endl;
  for (const auto& report : active->status()) {
    out << display_name(report.kind) << ": " << report.applied << "/" << report.unapplied << std::endl;
  }

  const auto& rejected = active->instrumentation().resolution_failures;
  if (!rejected.empty()) {
    out << "Rejected resources: " << rejected.size() << std::endl;
    for (const auto& failure : rejected) {
      out << "  " << failure.operation << ": " << failure.status.message << std::endl;
    }
  }
  return static_cast<int>(exit_status::ok);
}

} // namespace gr4ftx::commands
