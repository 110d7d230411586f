// filament/basic/diagnostic.hpp - Diagnostics shared by every compiler stage
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "filament/basic/source_manager.hpp"

namespace filament
{

// ============================================================================
// Error taxonomy
// ============================================================================

/**
 * Classification of compile errors.
 *
 * Each kind has a stable code (see error_code()) that is attached to the
 * diagnostic so tools and tests can match on it independently of wording.
 */
enum class ErrorKind : uint8_t {
  Syntax,
  UnboundIdentifier,
  DuplicateDefinition,
  CyclicImport,
  MalformedInterval,
  IntervalMismatch,
  BitwidthMismatch,
  ArgumentCount,
  UnboundOutput,
  GuardViolated,
  ReuseHazard,
  UnsatisfiableConstraints,
  UnderconstrainedExistential,
  SolverUnknown,
  InstantiationCycle,
  Io,
  Config,
};

[[nodiscard]] constexpr std::string_view error_code(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Syntax:
      return "E001";
    case ErrorKind::UnboundIdentifier:
      return "E010";
    case ErrorKind::DuplicateDefinition:
      return "E011";
    case ErrorKind::CyclicImport:
      return "E012";
    case ErrorKind::MalformedInterval:
      return "E020";
    case ErrorKind::IntervalMismatch:
      return "E021";
    case ErrorKind::BitwidthMismatch:
      return "E022";
    case ErrorKind::ArgumentCount:
      return "E023";
    case ErrorKind::UnboundOutput:
      return "E024";
    case ErrorKind::GuardViolated:
      return "E030";
    case ErrorKind::ReuseHazard:
      return "E031";
    case ErrorKind::UnsatisfiableConstraints:
      return "E040";
    case ErrorKind::UnderconstrainedExistential:
      return "E041";
    case ErrorKind::SolverUnknown:
      return "E042";
    case ErrorKind::InstantiationCycle:
      return "E050";
    case ErrorKind::Io:
      return "E090";
    case ErrorKind::Config:
      return "E091";
  }
  return "E000";
}

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Syntax:
      return "Syntax";
    case ErrorKind::UnboundIdentifier:
      return "UnboundIdentifier";
    case ErrorKind::DuplicateDefinition:
      return "DuplicateDefinition";
    case ErrorKind::CyclicImport:
      return "CyclicImport";
    case ErrorKind::MalformedInterval:
      return "MalformedInterval";
    case ErrorKind::IntervalMismatch:
      return "IntervalMismatch";
    case ErrorKind::BitwidthMismatch:
      return "BitwidthMismatch";
    case ErrorKind::ArgumentCount:
      return "ArgumentCount";
    case ErrorKind::UnboundOutput:
      return "UnboundOutput";
    case ErrorKind::GuardViolated:
      return "GuardViolated";
    case ErrorKind::ReuseHazard:
      return "ReuseHazard";
    case ErrorKind::UnsatisfiableConstraints:
      return "UnsatisfiableConstraints";
    case ErrorKind::UnderconstrainedExistential:
      return "UnderconstrainedExistential";
    case ErrorKind::SolverUnknown:
      return "SolverUnknown";
    case ErrorKind::InstantiationCycle:
      return "InstantiationCycle";
    case ErrorKind::Io:
      return "Io";
    case ErrorKind::Config:
      return "Config";
  }
  return "Unknown";
}

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

enum class LabelStyle : uint8_t {
  Primary,    ///< Direct cause of the diagnostic
  Secondary,  ///< Related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::optional<ErrorKind> kind;
  std::string code;  // e.g. "E021"
  std::string message;

  std::vector<Label> labels;
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds the finished diagnostic to its bag when it goes
 * out of scope.
 *
 * @code
 *   diags.report_error(range, "interval mismatch", "supplied here")
 *     .with_kind(ErrorKind::IntervalMismatch)
 *     .with_note("required [G, G+1]");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  /// Set the taxonomy kind and its stable code.
  DiagnosticBuilder & with_kind(ErrorKind kind);

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_note(
    SourceRange range, std::string message, std::string label_message = "");

  /// Shorthand for report_error(...).with_kind(kind).
  DiagnosticBuilder report(
    ErrorKind kind, SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t error_count() const;

  /// True if any diagnostic of the given kind was reported.
  [[nodiscard]] bool has(ErrorKind kind) const;
  [[nodiscard]] size_t count(ErrorKind kind) const;

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace filament
