#include "support/ScanError.hpp"

namespace skscan {

char ScanError::ID = 0;

std::error_code ScanError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

llvm::Error makeScanError(ScanErrc kind, const llvm::Twine& message) {
  return llvm::make_error<ScanError>(kind, message.str());
}

std::optional<ScanErrc> takeErrorKind(llvm::Error E) {
  std::optional<ScanErrc> kind;
  llvm::handleAllErrors(std::move(E),
                        [&](const ScanError& SE) { kind = SE.kind(); },
                        [](const llvm::ErrorInfoBase&) {});
  return kind;
}

} // namespace skscan
