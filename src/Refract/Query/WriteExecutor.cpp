// SPDX-License-Identifier: Apache-2.0

#include "../Error.hpp"
#include "../Key/EntityKey.hpp"
#include "../Predicate/OperatorTable.hpp"
#include "../SqlConnection.hpp"
#include "../SqlLogger.hpp"
#include "../SqlQuery.hpp"
#include "../SqlStatement.hpp"
#include "../SqlTransaction.hpp"
#include "ValueConversion.hpp"
#include "WriteExecutor.hpp"

#include <format>
#include <optional>

namespace Refract
{

namespace
{

    ConditionNode ColumnEquals(std::string const& table, std::string const& column, SqlVariant value)
    {
        return ConditionNode { ColumnCondition {
            .table = table, .column = column, .op = FieldOperator::Equals, .values = { std::move(value) } } };
    }

    ConditionNode KeyCondition(EntityInfo const& entity, SqlVariant value)
    {
        return ColumnEquals(entity.tableName, entity.PrimaryKey().columnName, std::move(value));
    }

    template <typename Builder>
    void ApplyCondition(Builder& query, ConditionNode const& condition, SqlQueryFormatter const& formatter)
    {
        if (IsTriviallyTrue(condition))
            return;

        auto conditionBindings = std::vector<SqlVariant> {};
        auto const sql = RenderCondition(condition, formatter, conditionBindings);
        query.Where(sql, std::move(conditionBindings));
    }

    void RequireMutationAllowed(EntityInfo const& entity, FieldInfo const& field, MutationKind kind)
    {
        if (!IsMutationAllowed(field, kind))
            throw QueryValidationError(std::format("Mutation {} is not supported by field {}.{} of type {}{}",
                                                   NameOf(kind),
                                                   entity.name,
                                                   field.name,
                                                   field.type,
                                                   field.nullable ? "" : " (not nullable)"));
    }

    /// The right-hand side of an arithmetic mutation, in the representation used for the computation.
    SqlVariant ArithmeticOperand(EntityInfo const& entity, FieldInfo const& field, FieldMutation const& mutation)
    {
        auto operand = IsIntegral(field.type) ? TryConvertValue(mutation.value, FieldType::Int64)
                                              : TryConvertValue(mutation.value, FieldType::Float64);
        if (!operand || operand->IsNull())
            throw QueryValidationError(std::format("Mutation {} of field {}.{} requires a numeric operand, got {}",
                                                   NameOf(mutation.kind),
                                                   entity.name,
                                                   field.name,
                                                   mutation.value));

        if (mutation.kind == MutationKind::Divide && operand->TryGetDouble().value_or(0.0) == 0.0)
            throw QueryValidationError(std::format("Division by zero on field {}.{}", entity.name, field.name));

        return std::move(*operand);
    }

    double Compute(MutationKind kind, double lhs, double rhs) noexcept
    {
        switch (kind)
        {
            case MutationKind::Increment:
                return lhs + rhs;
            case MutationKind::Decrement:
                return lhs - rhs;
            case MutationKind::Multiply:
                return lhs * rhs;
            case MutationKind::Divide:
                return lhs / rhs;
            case MutationKind::Set:
            case MutationKind::SetNull:
                break;
        }
        return rhs;
    }

    std::string_view ArithmeticOperator(MutationKind kind) noexcept
    {
        switch (kind)
        {
            case MutationKind::Increment:
                return "+";
            case MutationKind::Decrement:
                return "-";
            case MutationKind::Multiply:
                return "*";
            case MutationKind::Divide:
                return "/";
            case MutationKind::Set:
            case MutationKind::SetNull:
                break;
        }
        return "+";
    }

} // namespace

SqlRecord WriteExecutor::Create(CreateOperation const& operation)
{
    auto const& entity = Registry().Entity(operation.entity);
    auto transaction = SqlTransaction { Connection(), SqlTransactionMode::ROLLBACK };

    auto row = operation.data;
    auto lookups = std::vector<DeferredLookup> {};
    auto relatedRowMutations = std::vector<std::pair<RelationInfo const*, RelationMutation const*>> {};

    for (auto const& mutation: operation.relations)
    {
        auto const& relation = entity.RequireRelation(mutation.relation);
        if (!relation.OwnsForeignKey())
        {
            relatedRowMutations.emplace_back(&relation, &mutation);
            continue;
        }

        if (mutation.kind != RelationMutationKind::Connect || mutation.selectors.size() != 1)
            throw QueryValidationError(std::format("Relation {}.{} supports only Connect to a single record on create",
                                                   entity.name,
                                                   relation.name));
        lookups.push_back(MakeConnectLookup(entity, relation, mutation.selectors.front(), row));
    }

    RunDeferredLookups(lookups);

    auto created = Refetch(entity, InsertRow(entity, row));

    for (auto const& [relation, mutation]: relatedRowMutations)
        ApplyRelatedRowMutation(entity, created, *relation, *mutation);

    transaction.Commit();
    return created;
}

SqlRecord WriteExecutor::Update(UpdateOperation const& operation)
{
    auto const& entity = Registry().Entity(operation.entity);
    auto transaction = SqlTransaction { Connection(), SqlTransactionMode::ROLLBACK };

    auto const current = RequireExisting(entity, operation.where);
    auto updated = current;
    ApplyFieldMutations(entity, updated, operation.mutations);

    auto lookups = std::vector<DeferredLookup> {};
    auto relatedRowMutations = std::vector<std::pair<RelationInfo const*, RelationMutation const*>> {};

    for (auto const& mutation: operation.relations)
    {
        auto const& relation = entity.RequireRelation(mutation.relation);
        if (!relation.OwnsForeignKey())
        {
            relatedRowMutations.emplace_back(&relation, &mutation);
            continue;
        }

        switch (mutation.kind)
        {
            case RelationMutationKind::Connect:
                if (mutation.selectors.size() != 1)
                    throw QueryValidationError(
                        std::format("Relation {}.{} connects exactly one record", entity.name, relation.name));
                lookups.push_back(MakeConnectLookup(entity, relation, mutation.selectors.front(), updated));
                break;
            case RelationMutationKind::Disconnect:
                if (!relation.foreignKeyNullable)
                    throw QueryValidationError(std::format(
                        "Relation {}.{} cannot be disconnected, its foreign key is not nullable", entity.name, relation.name));
                updated.Set(relation.foreignKeyField, SqlVariant { SqlNullValue });
                break;
            case RelationMutationKind::Set:
            case RelationMutationKind::CreateNested:
                throw QueryValidationError(std::format(
                    "Relation {}.{} does not support {}", entity.name, relation.name, NameOf(mutation.kind)));
        }
    }

    RunDeferredLookups(lookups);

    auto const& primaryKey = entity.PrimaryKey();
    auto assignments = Assignments {};
    for (auto const& column: updated.Columns())
    {
        auto const* field = entity.FindField(column.name);
        if (!field)
            continue;
        if (auto const* before = current.Find(column.name); before && *before == column.value)
            continue;
        assignments.emplace_back(field->columnName, ConvertValue(column.value, field->type));
    }

    // An update without changes leaves the row untouched.
    if (!assignments.empty())
        (void) UpdateRows(entity, assignments, KeyCondition(entity, current.Get(primaryKey.name)));

    auto result = Refetch(entity, updated.Get(primaryKey.name));

    for (auto const& [relation, mutation]: relatedRowMutations)
        ApplyRelatedRowMutation(entity, result, *relation, *mutation);

    transaction.Commit();
    return result;
}

SqlRecord WriteExecutor::Delete(DeleteOperation const& operation)
{
    auto const& entity = Registry().Entity(operation.entity);
    auto transaction = SqlTransaction { Connection(), SqlTransactionMode::ROLLBACK };

    auto current = RequireExisting(entity, operation.where);
    (void) DeleteRows(entity, KeyCondition(entity, current.Get(entity.PrimaryKey().name)));

    transaction.Commit();
    return current;
}

SqlRecord WriteExecutor::Upsert(UpsertOperation const& operation)
{
    auto const& entity = Registry().Entity(operation.entity);
    if (operation.where.empty())
        throw QueryValidationError(std::format("Upsert on {} requires a where condition", entity.name));

    auto transaction = SqlTransaction { Connection(), SqlTransactionMode::ROLLBACK };

    auto const existing = m_reader.Select(entity, ReadSpec { .where = operation.where, .take = 1 });
    auto result = existing.empty()
                      ? Create(CreateOperation { .entity = entity.name, .data = operation.create, .relations = {} })
                      : Update(UpdateOperation { .entity = entity.name,
                                                 .where = operation.where,
                                                 .mutations = operation.update,
                                                 .relations = {} });

    transaction.Commit();
    return result;
}

std::pair<WriteKind, SqlRecord> WriteExecutor::Execute(WriteOperation const& operation)
{
    // clang-format off
    return std::visit(detail::overloaded {
        [&](CreateOperation const& op) { return std::pair { WriteKind::Create, Create(op) }; },
        [&](UpdateOperation const& op) { return std::pair { WriteKind::Update, Update(op) }; },
        [&](DeleteOperation const& op) { return std::pair { WriteKind::Delete, Delete(op) }; },
        [&](UpsertOperation const& op) { return std::pair { WriteKind::Upsert, Upsert(op) }; },
    }, operation);
    // clang-format on
}

size_t WriteExecutor::CreateMany(std::string_view entityName, std::vector<SqlRecord> const& rows)
{
    auto const& entity = Registry().Entity(entityName);
    auto transaction = SqlTransaction { Connection(), SqlTransactionMode::ROLLBACK };

    for (auto const& row: rows)
        (void) InsertRow(entity, row);

    transaction.Commit();
    return rows.size();
}

size_t WriteExecutor::UpdateMany(std::string_view entityName,
                                 std::vector<Predicate> const& where,
                                 std::vector<FieldMutation> const& mutations)
{
    auto const& entity = Registry().Entity(entityName);
    if (mutations.empty())
        return m_reader.Count(entity, where);

    auto query = Connection().Query(entity.tableName).Update();

    for (auto const& mutation: mutations)
    {
        auto const& field = entity.RequireField(mutation.field);
        RequireMutationAllowed(entity, field, mutation.kind);

        switch (mutation.kind)
        {
            case MutationKind::Set:
                query.Set(field.columnName, ConvertValue(mutation.value, field.type));
                break;
            case MutationKind::SetNull:
                query.Set(field.columnName, SqlNullValue);
                break;
            case MutationKind::Increment:
            case MutationKind::Decrement:
            case MutationKind::Multiply:
            case MutationKind::Divide:
                query.SetExpression(field.columnName,
                                    std::format("{} {} ?",
                                                ::detail::MakeSqlColumnName(field.columnName),
                                                ArithmeticOperator(mutation.kind)),
                                    { ArithmeticOperand(entity, field, mutation) });
                break;
        }
    }

    ApplyCondition(query, m_reader.CompileWhere(entity, where), Connection().QueryFormatter());

    auto stmt = SqlStatement { Connection() };
    stmt.Execute(query.Compose());
    return stmt.NumRowsAffected();
}

size_t WriteExecutor::DeleteMany(std::string_view entityName, std::vector<Predicate> const& where)
{
    auto const& entity = Registry().Entity(entityName);
    return DeleteRows(entity, m_reader.CompileWhere(entity, where));
}

SqlVariant WriteExecutor::InsertRow(EntityInfo const& entity, SqlRecord const& data)
{
    auto const& primaryKey = entity.PrimaryKey();

    auto query = Connection().Query(entity.tableName).Insert();
    for (auto const& column: data.Columns())
    {
        auto const& field = entity.RequireField(column.name);
        // A missing primary key is generated by the database.
        if (field.primaryKey && column.value.IsNull())
            continue;
        query.Set(field.columnName, ConvertValue(column.value, field.type));
    }

    auto stmt = SqlStatement { Connection() };
    stmt.Execute(query.Compose());

    if (auto const key = data.GetOrNull(primaryKey.name); !key.IsNull())
        return ConvertValue(key, primaryKey.type);
    return ConvertValue(SqlVariant { stmt.LastInsertId(entity.tableName) }, primaryKey.type);
}

SqlRecord WriteExecutor::RequireExisting(EntityInfo const& entity, std::vector<Predicate> const& where) const
{
    if (where.empty())
        throw QueryValidationError(std::format("Write on {} requires a where condition", entity.name));

    auto rows = m_reader.Select(entity, ReadSpec { .where = where, .take = 1 });
    if (rows.empty())
    {
        auto const condition = m_reader.Describe(entity, where);
        SqlLogger::GetLogger().OnRecordNotFound(entity.name, condition);
        throw RecordNotFoundError(entity.name, condition);
    }
    return std::move(rows.front());
}

SqlRecord WriteExecutor::RequireRelated(EntityInfo const& target, UniqueSelector const& selector) const
{
    auto related = m_reader.FindUnique(target, selector);
    if (!related)
    {
        auto const condition = selector.ToString();
        SqlLogger::GetLogger().OnRecordNotFound(target.name, condition);
        throw RecordNotFoundError(target.name, condition);
    }
    return std::move(*related);
}

SqlRecord WriteExecutor::Refetch(EntityInfo const& entity, SqlVariant const& primaryKey) const
{
    auto const& field = entity.PrimaryKey();
    auto row = m_reader.FindByColumn(entity, field.columnName, primaryKey);
    if (!row)
        throw RecordNotFoundError(entity.name, std::format("{} = {}", field.name, primaryKey));
    return std::move(*row);
}

DeferredLookup WriteExecutor::MakeConnectLookup(EntityInfo const& entity,
                                                RelationInfo const& relation,
                                                UniqueSelector const& selector,
                                                SqlRecord& row) const
{
    auto const& target = Registry().Entity(relation.targetEntity);
    return DeferredLookup {
        .entity = target.name,
        .selector = selector,
        .resolve = [this, &target](UniqueSelector const& s) { return m_reader.FindUnique(target, s); },
        .apply =
            [this, &entity, &relation, &row](SqlRecord const& related) {
                auto const key = EntityKey::FromSqlVariant(related.Get(relation.referencedField));
                row.Set(relation.foreignKeyField,
                        Registry().KeyTypes().ConvertKey(key, entity.name, relation.foreignKeyField));
            },
    };
}

void WriteExecutor::RunDeferredLookups(std::vector<DeferredLookup> const& lookups) const
{
    for (auto const& lookup: lookups)
    {
        auto const related = lookup.resolve(lookup.selector);
        auto const condition = lookup.selector.ToString();
        if (!related)
        {
            SqlLogger::GetLogger().OnRecordNotFound(lookup.entity, condition);
            throw RecordNotFoundError(lookup.entity, condition);
        }
        SqlLogger::GetLogger().OnDeferredLookupResolved(lookup.entity, condition);
        lookup.apply(*related);
    }
}

void WriteExecutor::ApplyFieldMutations(EntityInfo const& entity,
                                        SqlRecord& row,
                                        std::vector<FieldMutation> const& mutations)
{
    for (auto const& mutation: mutations)
    {
        auto const& field = entity.RequireField(mutation.field);
        RequireMutationAllowed(entity, field, mutation.kind);

        switch (mutation.kind)
        {
            case MutationKind::Set:
                row.Set(field.name, ConvertValue(mutation.value, field.type));
                break;
            case MutationKind::SetNull:
                row.Set(field.name, SqlVariant { SqlNullValue });
                break;
            case MutationKind::Increment:
            case MutationKind::Decrement:
            case MutationKind::Multiply:
            case MutationKind::Divide: {
                auto const operand = ArithmeticOperand(entity, field, mutation);
                auto const current = row.GetOrNull(field.name);
                // Arithmetic on NULL yields NULL, as in SQL.
                if (current.IsNull())
                    break;

                if (IsIntegral(field.type))
                {
                    if (!current.TryGetIntegral<long long>() && !current.TryGetIntegral<unsigned long long>())
                        throw QueryValidationError(
                            std::format("Field {}.{} holds a non-integral value {}", entity.name, field.name, current));

                    auto const result =
                        ComputeIntegralMutation(mutation.kind, current, operand.TryGetIntegral<long long>().value_or(0));
                    auto converted = result ? TryConvertValue(*result, field.type) : std::nullopt;
                    if (!converted)
                        throw QueryValidationError(std::format("Mutation {} of field {}.{} overflows its type {}",
                                                               NameOf(mutation.kind),
                                                               entity.name,
                                                               field.name,
                                                               field.type));
                    row.Set(field.name, std::move(*converted));
                }
                else
                {
                    auto const lhs = current.TryGetDouble();
                    if (!lhs)
                        throw QueryValidationError(
                            std::format("Field {}.{} holds a non-numeric value {}", entity.name, field.name, current));
                    auto const result = Compute(mutation.kind, *lhs, *operand.TryGetDouble());
                    row.Set(field.name, ConvertValue(SqlVariant { result }, field.type));
                }
                break;
            }
        }
    }
}

void WriteExecutor::ApplyRelatedRowMutation(EntityInfo const& entity,
                                            SqlRecord const& parent,
                                            RelationInfo const& relation,
                                            RelationMutation const& mutation)
{
    auto const& target = Registry().Entity(relation.targetEntity);
    auto const& targetKey = target.PrimaryKey();
    auto const foreignKey = Registry().KeyTypes().ConvertKey(
        EntityKey::FromSqlVariant(parent.Get(relation.referencedField)), target.name, relation.foreignKeyField);

    switch (mutation.kind)
    {
        case RelationMutationKind::CreateNested:
            for (auto const& row: mutation.rows)
            {
                auto child = row;
                child.Set(relation.foreignKeyField, foreignKey);
                (void) InsertRow(target, child);
            }
            break;
        case RelationMutationKind::Connect:
            for (auto const& selector: mutation.selectors)
            {
                auto const related = RequireRelated(target, selector);
                (void) UpdateRows(target,
                                  { { relation.foreignKeyColumn, foreignKey } },
                                  KeyCondition(target, related.Get(targetKey.name)));
            }
            break;
        case RelationMutationKind::Set: {
            if (relation.IsSingle())
                throw QueryValidationError(
                    std::format("Relation {}.{} is not a HasMany relation and cannot be set", entity.name, relation.name));

            auto keys = std::vector<SqlVariant> {};
            for (auto const& selector: mutation.selectors)
                keys.push_back(RequireRelated(target, selector).Get(targetKey.name));

            auto outside = std::vector<ConditionNode> {};
            outside.push_back(ColumnEquals(target.tableName, relation.foreignKeyColumn, foreignKey));
            outside.push_back(ConditionNode { ColumnCondition {
                .table = target.tableName, .column = targetKey.columnName, .op = FieldOperator::NotInSet, .values = keys } });

            // Rows leaving the relation lose their owner, or are removed if they cannot exist without one.
            if (relation.foreignKeyNullable)
                (void) UpdateRows(target,
                                  { { relation.foreignKeyColumn, SqlVariant { SqlNullValue } } },
                                  MakeAll(std::move(outside)));
            else
                (void) DeleteRows(target, MakeAll(std::move(outside)));

            if (!keys.empty())
                (void) UpdateRows(target,
                                  { { relation.foreignKeyColumn, foreignKey } },
                                  ConditionNode { ColumnCondition { .table = target.tableName,
                                                                    .column = targetKey.columnName,
                                                                    .op = FieldOperator::InSet,
                                                                    .values = std::move(keys) } });
            break;
        }
        case RelationMutationKind::Disconnect:
            throw QueryValidationError(std::format(
                "Relation {}.{} cannot be disconnected, only BelongsTo relations can", entity.name, relation.name));
    }
}

size_t WriteExecutor::UpdateRows(EntityInfo const& entity,
                                 Assignments const& assignments,
                                 ConditionNode const& condition)
{
    if (assignments.empty())
        return 0;

    auto query = Connection().Query(entity.tableName).Update();
    for (auto const& [column, value]: assignments)
        query.Set(column, value);
    ApplyCondition(query, condition, Connection().QueryFormatter());

    auto stmt = SqlStatement { Connection() };
    stmt.Execute(query.Compose());
    return stmt.NumRowsAffected();
}

size_t WriteExecutor::DeleteRows(EntityInfo const& entity, ConditionNode const& condition)
{
    auto query = Connection().Query(entity.tableName).Delete();
    ApplyCondition(query, condition, Connection().QueryFormatter());

    auto stmt = SqlStatement { Connection() };
    stmt.Execute(query.Compose());
    return stmt.NumRowsAffected();
}

} // namespace Refract
