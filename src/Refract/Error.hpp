// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Refract
{

/// Raised at generation time when an entity declaration cannot be turned into metadata.
class SchemaError: public std::runtime_error
{
  public:
    SchemaError(std::string_view entityName, std::string_view what):
        std::runtime_error { std::format("Entity {}: {}", entityName.empty() ? "<unnamed>" : entityName, what) },
        m_entityName { entityName }
    {
    }

    [[nodiscard]] std::string const& EntityName() const noexcept
    {
        return m_entityName;
    }

  private:
    std::string m_entityName;
};

/// Base class of all runtime errors raised by the entity layer.
///
/// Backend failures are not wrapped and reach the caller as SqlException.
class RefractError: public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// No row matched the condition of an update, delete, connect or deferred lookup.
class RecordNotFoundError: public RefractError
{
  public:
    RecordNotFoundError(std::string_view entityName, std::string_view condition):
        RefractError { std::format("No {} record found for {}", entityName, condition) },
        m_entityName { entityName },
        m_condition { condition }
    {
    }

    [[nodiscard]] std::string const& EntityName() const noexcept
    {
        return m_entityName;
    }

    [[nodiscard]] std::string const& Condition() const noexcept
    {
        return m_condition;
    }

  private:
    std::string m_entityName;
    std::string m_condition;
};

class RelationNotFoundError: public RefractError
{
  public:
    RelationNotFoundError(std::string_view entityName, std::string_view relationName):
        RefractError { std::format("Entity {} has no relation named {}", entityName, relationName) }
    {
    }
};

class FetcherMissingError: public RefractError
{
  public:
    explicit FetcherMissingError(std::string_view entityName):
        RefractError { std::format("No relation fetcher registered for entity {}", entityName) }
    {
    }
};

class KeyConversionError: public RefractError
{
  public:
    using RefractError::RefractError;
};

/// A query was built in a way that cannot be executed, e.g. an operator applied to a field type it does not support.
class QueryValidationError: public RefractError
{
  public:
    using RefractError::RefractError;
};

/// An operation met a predicate or result variant it does not know.
///
/// Raised only when generated code and the runtime library do not match.
class PredicateContractError: public RefractError
{
  public:
    using RefractError::RefractError;
};

} // namespace Refract
