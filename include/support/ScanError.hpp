#pragma once
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>

namespace skscan {

enum class ScanErrc {
  PathNotFound,
  NotADirectory,
  FileReadFailure,
  UnknownOutputFormat,
  UnknownSeverity,
  DuplicateRule,
  UnknownRule,
  InvalidConfig,
  OutputWriteFailure,
};

// Every failure the scanner reports travels as one of these inside llvm::Error.
class ScanError : public llvm::ErrorInfo<ScanError> {
public:
  static char ID;

  ScanError(ScanErrc kind, std::string message)
    : Kind(kind), Message(std::move(message)) {}

  void log(llvm::raw_ostream& OS) const override { OS << Message; }
  std::string message() const override { return Message; }
  std::error_code convertToErrorCode() const override;

  ScanErrc kind() const { return Kind; }

private:
  ScanErrc    Kind;
  std::string Message;
};

llvm::Error makeScanError(ScanErrc kind, const llvm::Twine& message);

// Consumes E. Returns its kind if it was a ScanError, nullopt for success or
// foreign errors.
std::optional<ScanErrc> takeErrorKind(llvm::Error E);

} // namespace skscan
