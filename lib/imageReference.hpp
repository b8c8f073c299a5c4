#ifndef RETAGGER_IMAGE_REFERENCE_HPP
#define RETAGGER_IMAGE_REFERENCE_HPP

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace Retagger {
    class ParseError : public std::invalid_argument {
    public:
        enum class Kind {EmptyName, UnsupportedFormat};

        ParseError(Kind kind, const std::string& message);

        Kind kind() const { return kind_; }

    private:
        Kind kind_;
    };

    /**
     * A container image reference decomposed as registry/bucket/repository:tag.
     * "bucket" is the namespace segment, "library" for official images.
     */
    struct ImageReference {
        std::string registry;
        std::string bucket;
        std::string repository;
        std::string tag;

        static const std::string DEFAULT_REGISTRY;
        static const std::string DEFAULT_BUCKET;
        static const std::string DEFAULT_TAG;

        // Throws ParseError.
        static ImageReference parse(const std::string& raw);

        std::string source() const;
        std::string target(const std::string& targetDomain) const;
    };

    bool operator==(const ImageReference& lhs, const ImageReference& rhs);
    bool operator!=(const ImageReference& lhs, const ImageReference& rhs);
    std::ostream& operator<<(std::ostream& os, const ImageReference& reference);

    // Minimal canonical form: the default registry and the "library" bucket are elided.
    std::string buildSourceReference(const std::string& registry, const std::string& bucket,
                                     const std::string& repository, const std::string& tag);

    // Never elided: the target is always domain/bucket/repository:tag.
    std::string buildTargetReference(const std::string& targetDomain, const std::string& bucket,
                                     const std::string& repository, const std::string& tag);

    // "host:5000/ns/app:1.0" -> {"host:5000/ns/app", "1.0"}. Missing tag gives "latest".
    std::pair<std::string, std::string> splitNameAndTag(const std::string& reference);
}

#endif // RETAGGER_IMAGE_REFERENCE_HPP
