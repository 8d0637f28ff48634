/**
 * @file registry.cpp
 * @brief Type registry implementation
 */

#include "objfmt/registry.hpp"

#include "objfmt/vocabulary.hpp"

#include <algorithm>
#include <array>

namespace objfmt {

namespace {

constexpr std::array<std::string_view, 3> kReservedTags = {vocab::kSetTag,
                                                           vocab::kFrozenSetTag,
                                                           vocab::kPathTag};

}  // namespace

VoidResult TypeRegistry::register_type(TypeDescriptor descriptor)
{
    if (descriptor.tag.empty()) {
        return make_error(errc::kInvalidDescriptor, "Type descriptor has an empty tag");
    }
    if (descriptor.encode == nullptr || descriptor.decode == nullptr) {
        return make_error(errc::kInvalidDescriptor,
                          "Type descriptor for " + descriptor.tag + " lacks encode or decode");
    }
    if (std::ranges::find(kReservedTags, std::string_view(descriptor.tag)) != kReservedTags.end()) {
        return make_error(errc::kTagConflict,
                          "Tag " + descriptor.tag + " is reserved for built-in stage encodings");
    }

    auto it = m_descriptors.find(descriptor.tag);
    if (it == m_descriptors.end()) {
        std::string tag = descriptor.tag;
        m_descriptors.emplace(std::move(tag), std::move(descriptor));
        return {};
    }
    if (it->second == descriptor) {
        return {};
    }
    return make_error(errc::kTagConflict,
                      "Tag " + descriptor.tag + " is already registered with a different descriptor");
}

const TypeDescriptor* TypeRegistry::resolve(std::string_view tag) const noexcept
{
    auto it = m_descriptors.find(tag);
    return it == m_descriptors.end() ? nullptr : &it->second;
}

std::vector<std::string> TypeRegistry::tags() const
{
    std::vector<std::string> result;
    result.reserve(m_descriptors.size());
    for (const auto& [tag, _] : m_descriptors) {
        result.push_back(tag);
    }
    return result;
}

}  // namespace objfmt
