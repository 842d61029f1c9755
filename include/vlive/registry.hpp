#pragma once
#include "types.hpp"
#include "error.hpp"
#include <array>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vlive {

class ToolRegistry;

/// Lazy view over the registry in category order, registration order within a
/// category. Iterating again restarts from the first tool.
class CategoryListing {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ToolDescriptor;
        using difference_type = std::ptrdiff_t;
        using pointer = const ToolDescriptor*;
        using reference = const ToolDescriptor&;

        iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }
        iterator& operator++();
        iterator operator++(int) { auto tmp = *this; ++*this; return tmp; }

        bool operator==(const iterator& o) const {
            return registry_ == o.registry_ && bucket_ == o.bucket_ && pos_ == o.pos_;
        }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class CategoryListing;
        iterator(const ToolRegistry* r, size_t bucket, size_t pos);
        void skip_empty();

        const ToolRegistry* registry_{nullptr};
        size_t bucket_{kCategoryCount};
        size_t pos_{0};
    };

    explicit CategoryListing(const ToolRegistry& registry) : registry_(&registry) {}

    [[nodiscard]] iterator begin() const;
    [[nodiscard]] iterator end() const;

private:
    const ToolRegistry* registry_;
};

/// Name -> ToolDescriptor catalog. Populated at startup, then sealed and
/// shared read-only; const access needs no locking.
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// Throws DuplicateToolError (registry unchanged), SchemaError for an
    /// inconsistent input schema, RegistrySealedError after seal().
    const ToolDescriptor& add(ToolDescriptor descriptor);

    /// Throws UnknownToolError.
    [[nodiscard]] const ToolDescriptor& resolve(const std::string& name) const;

    /// nullptr if absent.
    [[nodiscard]] const ToolDescriptor* find(const std::string& name) const;

    [[nodiscard]] CategoryListing list_by_category() const { return CategoryListing(*this); }

    /// Tools of one category, in registration order.
    [[nodiscard]] std::vector<const ToolDescriptor*> in_category(Category c) const;

    [[nodiscard]] bool contains(const std::string& name) const { return index_.count(name) > 0; }
    [[nodiscard]] size_t size() const { return tools_.size(); }
    [[nodiscard]] bool empty() const { return tools_.empty(); }

    /// Forbid further registration.
    void seal() { sealed_ = true; }
    [[nodiscard]] bool sealed() const { return sealed_; }

private:
    friend class CategoryListing;

    // unique_ptr keeps descriptor addresses stable across growth
    std::vector<std::unique_ptr<const ToolDescriptor>> tools_;
    std::unordered_map<std::string, size_t> index_;
    std::array<std::vector<size_t>, kCategoryCount> by_category_;
    bool sealed_{false};
};

} // namespace vlive
