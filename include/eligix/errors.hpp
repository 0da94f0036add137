#pragma once

#include <stdexcept>
#include <string>

namespace eligix {

    /**
     * @brief Base of every error raised by an analysis run
     *
     * Errors carry the label of the layer that triggered them (empty when the
     * failure is not tied to a layer). The engine attaches the label while the
     * exception propagates, so what() always reads "<layer>: <message>".
     */
    class Error : public std::runtime_error {
      public:
        explicit Error(const std::string &message) : std::runtime_error(message), message_(message), what_(message) {}

        const char *what() const noexcept override { return what_.c_str(); }

        /// Message without the layer prefix
        const std::string &message() const noexcept { return message_; }

        /// Label of the offending layer, e.g. "excluded[1] 'roads'"
        const std::string &layer() const noexcept { return layer_; }

        /// Attach a layer label; only the first label sticks
        void set_layer(const std::string &layer) {
            if (!layer_.empty() || layer.empty())
                return;
            layer_ = layer;
            what_ = layer_ + ": " + message_;
        }

      private:
        std::string message_;
        std::string layer_;
        std::string what_;
    };

    /// Malformed or unsatisfiable attribute predicate
    class InvalidFilterError : public Error {
      public:
        using Error::Error;
    };

    /// Negative or non-finite buffer distance, or unusable buffer options
    class InvalidBufferError : public Error {
      public:
        using Error::Error;
    };

    /// Negative or non-finite sliver threshold
    class InvalidThresholdError : public Error {
      public:
        using Error::Error;
    };

    /// Reference system unknown, undetermined or not reprojectable
    class CRSResolutionError : public Error {
      public:
        using Error::Error;
    };

    /// Layer source that the loader cannot resolve
    class LayerResolutionError : public Error {
      public:
        using Error::Error;
    };

    /// Union, difference, intersection or buffer failed on degenerate input
    class GeometryOperationError : public Error {
      public:
        using Error::Error;
    };

} // namespace eligix
