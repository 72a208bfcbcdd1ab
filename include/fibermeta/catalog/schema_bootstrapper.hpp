#pragma once

#include "fibermeta/store/relational_store.hpp"
#include "fibermeta/store/store_transaction.hpp"

#include <cstddef>
#include <functional>
#include <system_error>

namespace fibermeta::catalog {

enum class BootstrapState {
    Absent,
    Complete,
    Partial
};

struct SchemaBootstrapConfig final {
    store::RelationalStore* store = nullptr;
    // Runs inside the bootstrap transaction after the tables exist. Side
    // effects outside the store register their undo on the transaction.
    std::function<std::error_code(store::StoreTransaction&)> seed_default_database{};
};

class SchemaBootstrapper final {
public:
    explicit SchemaBootstrapper(SchemaBootstrapConfig config);

    [[nodiscard]] std::error_code verify(BootstrapState& state) const;

    // Absent: create every catalog table and seed. Complete: no-op.
    // Partial: CorruptedCatalog, nothing is touched.
    [[nodiscard]] std::error_code run(BootstrapState* observed = nullptr) const;

    [[nodiscard]] static std::size_t required_table_count() noexcept;

private:
    [[nodiscard]] std::error_code create_tables() const;

    SchemaBootstrapConfig config_{};
};

}  // namespace fibermeta::catalog
