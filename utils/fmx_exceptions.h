#ifndef FMX_EXCEPTIONS_H
#define FMX_EXCEPTIONS_H

#include "fmx_string.h"
#include <exception>
#include <stdexcept>

// ============================================================================
// EXCEPTION HIERARCHY
// ============================================================================
//
// fmx_exception (base)
// ├── fmx_document_exception
// │   └── fmx_document_closed_exception
// └── fmx_strategy_exception
//
// ============================================================================

class fmx_exception : public std::exception {
protected:
  fmx_string message_;

public:
  explicit fmx_exception(const fmx_string& message)
    : message_(message) {}

  virtual ~fmx_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

// Document engine failure (open, decode, page access)
class fmx_document_exception : public fmx_exception {
protected:
  fmx_string source_;

public:
  fmx_document_exception(const fmx_string& message, const fmx_string& source)
    : fmx_exception(message), source_(source) {}

  fmx_string get_source() const { return source_; }
};

// Access to or release of a handle that is no longer open
class fmx_document_closed_exception : public fmx_document_exception {
public:
  explicit fmx_document_closed_exception(const fmx_string& source)
    : fmx_document_exception("Document is not open: " + source, source) {}
};

// Internal fault of one extraction strategy. The orchestrator isolates it.
class fmx_strategy_exception : public fmx_exception {
protected:
  fmx_string strategy_;

public:
  fmx_strategy_exception(const fmx_string& strategy, const fmx_string& message)
    : fmx_exception(strategy + ": " + message), strategy_(strategy) {}

  fmx_string get_strategy() const { return strategy_; }
};

#endif // FMX_EXCEPTIONS_H
