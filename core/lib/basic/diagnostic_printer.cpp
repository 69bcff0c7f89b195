// lineage/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "lineage/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace lineage
{

namespace
{

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (diag.location && diag.location->is_valid()) {
    std::string filename = diag.location->file;
    if (!filename.empty()) {
      std::error_code ec;
      auto rel_path =
        std::filesystem::relative(filename, std::filesystem::current_path(), ec);
      if (!ec && !rel_path.empty()) {
        filename = rel_path.string();
      }
    } else {
      filename = "<manifest>";
    }
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, diag.location->line, diag.location->column));
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Diagnostics without a location keep their relative order at the end
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const bool a_loc = a.location && a.location->is_valid();
      const bool b_loc = b.location && b.location->is_valid();
      if (a_loc != b_loc) return a_loc;
      if (!a_loc) return false;
      if (a.location->line != b.location->line) return a.location->line < b.location->line;
      return a.location->column < b.location->column;
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
    }
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace lineage
