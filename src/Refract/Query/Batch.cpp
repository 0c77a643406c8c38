// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../SqlTransaction.hpp"
#include "Batch.hpp"
#include "WriteExecutor.hpp"

#include <format>
#include <ranges>
#include <variant>

namespace Refract
{

Batch& Batch::Add(WriteOperation operation)
{
    m_operations.emplace_back(std::move(operation));
    return *this;
}

std::vector<BatchResult> Batch::Exec()
{
    for (auto const&& [index, operation]: m_operations | std::views::enumerate)
    {
        auto const& entityName = std::visit([](auto const& op) -> std::string const& { return op.entity; }, operation);
        if (entityName.empty())
            throw QueryValidationError(std::format("Batch operation {} names no entity", index));
    }

    auto transaction = SqlTransaction { m_connection, SqlTransactionMode::ROLLBACK };
    auto writer = WriteExecutor { m_connection, m_registry };

    auto results = std::vector<BatchResult> {};
    results.reserve(m_operations.size());
    for (auto const& operation: m_operations)
    {
        auto [kind, record] = writer.Execute(operation);
        results.push_back(BatchResult { .kind = kind, .record = std::move(record) });
    }

    transaction.Commit();
    m_operations.clear();
    return results;
}

} // namespace Refract
