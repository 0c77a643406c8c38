// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Client.hpp"
#include "Error.hpp"
#include "Key/EntityKey.hpp"
#include "Key/KeyTypeRegistry.hpp"
#include "Predicate/Mutation.hpp"
#include "Predicate/OperatorTable.hpp"
#include "Predicate/Predicate.hpp"
#include "Query/AggregateQuery.hpp"
#include "Query/Batch.hpp"
#include "Query/EntityRegistry.hpp"
#include "Query/RawQuery.hpp"
#include "Query/ReadQuery.hpp"
#include "Query/SqlRecord.hpp"
#include "Query/ValueConversion.hpp"
#include "Query/WriteQuery.hpp"
#include "Schema/Entity.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"
#include "SqlTransaction.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
