#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace rcs::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    return Document(
        yyjson_read(payload.data(), payload.size(), static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

  std::string write(bool pretty = false) const {
    if (!doc_) {
      return {};
    }
    auto flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    char *json = yyjson_write(doc_, flags, nullptr);
    std::string result = json ? json : std::string();
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  // Copies an immutable document, used to forward parsed CLI payloads.
  static MutableDocument from(Document const &source) {
    MutableDocument result;
    if (result.doc_ && source.root()) {
      result.set_root(yyjson_val_mut_copy(result.doc_, source.root()));
    }
    return result;
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_ || !root()) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

inline std::optional<std::string_view> string_member(yyjson_val *object,
                                                     char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string_view(yyjson_get_str(value), yyjson_get_len(value));
}

} // namespace rcs::json
