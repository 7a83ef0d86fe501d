/*
 * Errors.hpp
 *
 * Exception types reported by the compositing engine. None of them is fatal:
 * every failure leaves the engine usable and can be retried by the user.
 */
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

//! Base class for all engine failures.
class InkVisionError : public std::runtime_error {
   public:
    explicit InkVisionError(const std::string& msg) : std::runtime_error(msg) {}
};

//! A source could not be read or decoded into a bitmap.
class DecodeError : public InkVisionError {
   public:
    DecodeError(const std::string& source, const std::string& reason)
        : InkVisionError("Failed to decode '" + source + "': " + reason),
          source_(source),
          reason_(reason) {}

    const std::string& source() const { return source_; }
    const std::string& reason() const { return reason_; }

   private:
    std::string source_;
    std::string reason_;
};

//! The current composite could not be exported.
class ExportError : public InkVisionError {
   public:
    enum class Reason { NoRender, Tainted, EncodeFailed };

    ExportError(Reason reason, const std::string& msg)
        : InkVisionError(msg), reason_(reason) {}

    Reason reason() const { return reason_; }

   private:
    Reason reason_;
};

//! The design generator returned no usable image.
class GenerationFailure : public InkVisionError {
   public:
    explicit GenerationFailure(const std::string& msg) : InkVisionError(msg) {}
};

#endif
