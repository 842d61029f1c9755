#include "vlive/registry.hpp"
#include "vlive/schema.hpp"

namespace vlive {

namespace {

size_t bucket_of(Category c) {
    return static_cast<size_t>(c);
}

} // anonymous namespace

// ---------- ToolRegistry ----------

const ToolDescriptor& ToolRegistry::add(ToolDescriptor descriptor) {
    if (sealed_) {
        throw RegistrySealedError("Registry is sealed; cannot add tool: " + descriptor.name);
    }
    if (descriptor.name.empty()) {
        throw SchemaError("Tool name must not be empty");
    }
    if (!descriptor.handler) {
        throw SchemaError("Tool '" + descriptor.name + "' has no handler");
    }
    if (index_.count(descriptor.name) > 0) {
        throw DuplicateToolError(descriptor.name);
    }
    SchemaValidator::check(descriptor.input_schema);

    size_t idx = tools_.size();
    size_t bucket = bucket_of(descriptor.category);
    auto owned = std::make_unique<const ToolDescriptor>(std::move(descriptor));
    const ToolDescriptor& ref = *owned;

    tools_.push_back(std::move(owned));
    index_.emplace(ref.name, idx);
    by_category_[bucket].push_back(idx);
    return ref;
}

const ToolDescriptor& ToolRegistry::resolve(const std::string& name) const {
    const ToolDescriptor* d = find(name);
    if (!d) throw UnknownToolError(name);
    return *d;
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return tools_[it->second].get();
}

std::vector<const ToolDescriptor*> ToolRegistry::in_category(Category c) const {
    std::vector<const ToolDescriptor*> out;
    const auto& bucket = by_category_[bucket_of(c)];
    out.reserve(bucket.size());
    for (size_t idx : bucket) out.push_back(tools_[idx].get());
    return out;
}

// ---------- CategoryListing ----------

CategoryListing::iterator::iterator(const ToolRegistry* r, size_t bucket, size_t pos)
    : registry_(r), bucket_(bucket), pos_(pos) {
    skip_empty();
}

void CategoryListing::iterator::skip_empty() {
    while (bucket_ < kCategoryCount && pos_ >= registry_->by_category_[bucket_].size()) {
        ++bucket_;
        pos_ = 0;
    }
}

CategoryListing::iterator::reference CategoryListing::iterator::operator*() const {
    size_t idx = registry_->by_category_[bucket_][pos_];
    return *registry_->tools_[idx];
}

CategoryListing::iterator& CategoryListing::iterator::operator++() {
    ++pos_;
    skip_empty();
    return *this;
}

CategoryListing::iterator CategoryListing::begin() const {
    return iterator(registry_, 0, 0);
}

CategoryListing::iterator CategoryListing::end() const {
    return iterator(registry_, kCategoryCount, 0);
}

} // namespace vlive
