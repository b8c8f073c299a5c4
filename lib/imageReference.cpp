#include "imageReference.hpp"

#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/format.hpp>

namespace Retagger {
    const std::string ImageReference::DEFAULT_REGISTRY{"docker.io"};
    const std::string ImageReference::DEFAULT_BUCKET{"library"};
    const std::string ImageReference::DEFAULT_TAG{"latest"};

    ParseError::ParseError(Kind kind, const std::string& message) : std::invalid_argument(message), kind_(kind) {}

    std::pair<std::string, std::string> splitNameAndTag(const std::string& reference) {
        auto colon = reference.rfind(':');
        if (colon == std::string::npos) {
            return {reference, ImageReference::DEFAULT_TAG};
        }
        auto tag = reference.substr(colon + 1);
        // A colon followed by a path belongs to a registry port, not to a tag
        if (tag.find('/') != std::string::npos) {
            return {reference, ImageReference::DEFAULT_TAG};
        }
        if (tag.empty()) {
            tag = ImageReference::DEFAULT_TAG;
        }
        return {reference.substr(0, colon), tag};
    }

    ImageReference ImageReference::parse(const std::string& raw) {
        if (raw.empty()) {
            throw ParseError(ParseError::Kind::EmptyName, "Image name is empty");
        }

        auto [path, tag] = splitNameAndTag(raw);

        std::vector<std::string> parts;
        boost::algorithm::split(parts, path, boost::algorithm::is_any_of("/"));

        for (const auto& part : parts) {
            if (part.empty()) {
                throw ParseError(ParseError::Kind::EmptyName,
                                 (boost::format("Image name has an empty segment: %s") % raw).str());
            }
        }

        switch (parts.size()) {
            case 1:
                return {DEFAULT_REGISTRY, DEFAULT_BUCKET, parts[0], tag};
            case 2:
                // "library/name" is the official namespace, anything else is taken as a registry
                if (parts[0] == DEFAULT_BUCKET) {
                    return {DEFAULT_REGISTRY, DEFAULT_BUCKET, parts[1], tag};
                }
                return {parts[0], DEFAULT_BUCKET, parts[1], tag};
            case 3:
                return {parts[0], parts[1], parts[2], tag};
            default:
                throw ParseError(ParseError::Kind::UnsupportedFormat,
                                 (boost::format("Unsupported image name format: %s") % raw).str());
        }
    }

    std::string ImageReference::source() const {
        return buildSourceReference(registry, bucket, repository, tag);
    }

    std::string ImageReference::target(const std::string& targetDomain) const {
        return buildTargetReference(targetDomain, bucket, repository, tag);
    }

    std::string buildSourceReference(const std::string& registry, const std::string& bucket,
                                     const std::string& repository, const std::string& tag) {
        if (registry == ImageReference::DEFAULT_REGISTRY && bucket == ImageReference::DEFAULT_BUCKET) {
            return repository + ":" + tag;
        }
        if (bucket == ImageReference::DEFAULT_BUCKET) {
            return registry + "/" + repository + ":" + tag;
        }
        return registry + "/" + bucket + "/" + repository + ":" + tag;
    }

    std::string buildTargetReference(const std::string& targetDomain, const std::string& bucket,
                                     const std::string& repository, const std::string& tag) {
        const auto& namespaceSegment = bucket.empty() ? ImageReference::DEFAULT_BUCKET : bucket;
        return targetDomain + "/" + namespaceSegment + "/" + repository + ":" + tag;
    }

    bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
        return lhs.registry == rhs.registry
            && lhs.bucket == rhs.bucket
            && lhs.repository == rhs.repository
            && lhs.tag == rhs.tag;
    }

    bool operator!=(const ImageReference& lhs, const ImageReference& rhs) {
        return !(lhs == rhs);
    }

    std::ostream& operator<<(std::ostream& os, const ImageReference& reference) {
        os << reference.registry << '/' << reference.bucket << '/' << reference.repository << ':' << reference.tag;
        return os;
    }
}
