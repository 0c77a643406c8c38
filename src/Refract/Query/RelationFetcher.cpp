// SPDX-License-Identifier: Apache-2.0

#include "QueryExecutor.hpp"
#include "RelationFetcher.hpp"
#include "ValueConversion.hpp"

namespace Refract
{

std::vector<SqlRecord> GenericRelationFetcher::Fetch(SqlConnection& connection,
                                                     EntityRegistry const& registry,
                                                     ReadSpec const& spec,
                                                     std::string_view columnName,
                                                     SqlVariant const& value) const
{
    auto const* field = m_entity.FindFieldByColumn(columnName);
    auto boundValue = field ? ConvertValue(value, field->type) : value;

    auto link = std::vector<ConditionNode> {};
    link.push_back(ConditionNode { ColumnCondition {
        .table = m_entity.tableName,
        .column = std::string(columnName),
        .op = FieldOperator::Equals,
        .values = { std::move(boundValue) },
    } });

    return QueryExecutor { connection, registry }.Select(m_entity, spec, std::move(link));
}

} // namespace Refract
