// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "EntityRegistry.hpp"
#include "WriteOperation.hpp"

#include <concepts>
#include <utility>
#include <vector>

class SqlConnection;

namespace Refract
{

struct BatchResult
{
    WriteKind kind = WriteKind::Create;
    SqlRecord record;
};

/// An ordered list of writes, executed in one transaction.
///
/// Either all writes are committed, or, if any of them fails, none is and the error is rethrown.
class REFRACT_API Batch
{
  public:
    Batch(SqlConnection& connection, EntityRegistry const& registry) noexcept:
        m_connection { connection },
        m_registry { registry }
    {
    }

    Batch& Add(WriteOperation operation);

    /// Adds the operation of a create, update, delete or upsert builder.
    template <typename Builder>
        requires requires(Builder&& builder) {
            { std::forward<Builder>(builder).Operation() } -> std::convertible_to<WriteOperation>;
        }
    Batch& Add(Builder&& builder)
    {
        return Add(WriteOperation { std::forward<Builder>(builder).Operation() });
    }

    [[nodiscard]] size_t Size() const noexcept
    {
        return m_operations.size();
    }

    /// Executes all operations in order, returning one result per operation.
    ///
    /// @throws QueryValidationError if an operation names no entity.
    std::vector<BatchResult> Exec();

  private:
    SqlConnection& m_connection;
    EntityRegistry const& m_registry;
    std::vector<WriteOperation> m_operations;
};

} // namespace Refract
