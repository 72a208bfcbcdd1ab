#include "fibermeta/catalog/schema_bootstrapper.hpp"

#include "fibermeta/catalog/catalog_errors.hpp"
#include "fibermeta/catalog/catalog_schema.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace fibermeta::catalog {

SchemaBootstrapper::SchemaBootstrapper(SchemaBootstrapConfig config)
    : config_{std::move(config)}
{
}

std::size_t SchemaBootstrapper::required_table_count() noexcept
{
    return kCatalogTables.size();
}

std::error_code SchemaBootstrapper::verify(BootstrapState& state) const
{
    if (config_.store == nullptr) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::size_t present = 0U;
    for (const auto& table : kCatalogTables) {
        bool exists = false;
        if (auto ec = config_.store->table_exists(table.name, exists); ec) {
            return ec;
        }
        if (exists) {
            ++present;
        }
    }

    if (present == 0U) {
        state = BootstrapState::Absent;
    } else if (present == kCatalogTables.size()) {
        state = BootstrapState::Complete;
    } else {
        state = BootstrapState::Partial;
    }
    spdlog::debug("Catalog bootstrap check found {} of {} tables", present, kCatalogTables.size());
    return {};
}

std::error_code SchemaBootstrapper::run(BootstrapState* observed) const
{
    BootstrapState state = BootstrapState::Absent;
    if (auto ec = verify(state); ec) {
        return ec;
    }
    if (observed != nullptr) {
        *observed = state;
    }

    switch (state) {
    case BootstrapState::Complete:
        return {};
    case BootstrapState::Partial:
        spdlog::critical("Catalog store holds only part of the catalog tables; refusing to continue");
        return make_error_code(CatalogErrc::CorruptedCatalog);
    case BootstrapState::Absent:
        break;
    }

    store::StoreTransaction transaction{*config_.store};
    if (auto ec = transaction.begin(); ec) {
        return ec;
    }
    if (auto ec = create_tables(); ec) {
        (void)transaction.abort();
        return ec;
    }
    if (config_.seed_default_database) {
        if (auto ec = config_.seed_default_database(transaction); ec) {
            spdlog::error("Seeding the default database failed: {}", ec.message());
            (void)transaction.abort();
            return ec;
        }
    }
    if (auto ec = transaction.commit(); ec) {
        return ec;
    }

    spdlog::info("Catalog bootstrapped with {} tables", kCatalogTables.size());
    return {};
}

std::error_code SchemaBootstrapper::create_tables() const
{
    for (const auto& table : kCatalogTables) {
        if (auto ec = config_.store->execute_script(table.ddl); ec) {
            spdlog::error("Failed to create catalog table {}: {}", table.name, ec.message());
            return ec;
        }
        spdlog::debug("Created catalog table {}", table.name);
    }
    return {};
}

}  // namespace fibermeta::catalog
