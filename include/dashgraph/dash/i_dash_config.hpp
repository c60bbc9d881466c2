#pragma once

#include <dashgraph/core/context.hpp>
#include <dashgraph/core/result.hpp>
#include <dashgraph/object/i_object_store.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace dashgraph {

// ---------------------------------------------------------------------------
// IDashConfig — collaborators injected by the dashboard's bootstrap wiring.
// ---------------------------------------------------------------------------
class IDashConfig {
public:
    virtual ~IDashConfig() = default;

    IDashConfig(const IDashConfig&) = delete;
    IDashConfig& operator=(const IDashConfig&) = delete;
    IDashConfig(IDashConfig&&) = delete;
    IDashConfig& operator=(IDashConfig&&) = delete;

    /// Object store handle; may be null when the dashboard is not wired yet.
    [[nodiscard]] virtual std::shared_ptr<IObjectStore> ObjectStore() const = 0;

    /// Display path of an object (e.g. "/overview/namespace/default/...").
    [[nodiscard]] virtual Result<std::string, Error> ObjectPath(
        const Context& ctx,
        std::string_view api_version,
        std::string_view kind,
        std::string_view name) const = 0;

protected:
    IDashConfig() = default;
};

} // namespace dashgraph
