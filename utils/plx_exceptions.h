#ifndef PLX_EXCEPTIONS_H
#define PLX_EXCEPTIONS_H

#include <cstddef>
#include <exception>
#include <string>

// ============================================================================
// CONVERSION EXCEPTION HIERARCHY
// ============================================================================
//
// plx_exception (base)
// ├── plx_user_error
// │   └── plx_payload_too_large
// └── plx_processing_error
//
// Element-level failures never surface as exceptions past the extractor or
// reconstructor; they are logged and the element is skipped.
//
// ============================================================================

class plx_exception : public std::exception {
protected:
  std::string message_;
  std::string detail_;

public:
  explicit plx_exception(const std::string& message)
    : message_(message), detail_("") {}

  plx_exception(const std::string& message, const std::string& detail)
    : message_(message), detail_(detail) {}

  virtual ~plx_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }

  std::string get_detail() const { return detail_; }
};

// ============================================================================
// USER ERRORS (malformed or missing input, rejected before any engine call)
// ============================================================================

class plx_user_error : public plx_exception {
public:
  using plx_exception::plx_exception;
};

class plx_payload_too_large : public plx_user_error {
public:
  plx_payload_too_large(size_t size, size_t limit)
    : plx_user_error("Request body too large",
                     std::to_string(size) + " bytes exceeds limit of " + std::to_string(limit)) {}
};

// ============================================================================
// PROCESSING ERRORS (parsing or writing engine failed)
// ============================================================================

class plx_processing_error : public plx_exception {
public:
  enum class stage { parse, serialize };

private:
  stage stage_;
  int page_;

public:
  plx_processing_error(stage s, const std::string& message, const std::string& detail = "", int page = 0)
    : plx_exception(message, detail), stage_(s), page_(page) {}

  stage get_stage() const { return stage_; }

  // 1-based page number, 0 when the failure is not tied to a page
  int get_page() const { return page_; }
};

#endif // PLX_EXCEPTIONS_H
