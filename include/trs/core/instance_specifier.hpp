#pragma once
#include <string>
#include <string_view>

namespace trs::core {

// Names a configured storage in the manifest, e.g. "Task/Results"
class InstanceSpecifier {
    std::string id_;
public:
    explicit InstanceSpecifier(std::string_view id) : id_(id) {}
    const std::string& ToString() const { return id_; }
    bool operator==(const InstanceSpecifier& o) const { return id_ == o.id_; }
};

} // namespace trs::core
