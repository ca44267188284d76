// Copyright 2026 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "cursor/transform_chain.hpp"

#include "cursor/exceptions.hpp"

namespace batchcursor::cursor {

Value TransformChain::Apply(Document document) const {
  Value value(std::move(document));
  for (size_t i = 0; i < transforms_.size(); ++i) {
    auto result = transforms_[i](std::move(value));
    if (!result) throw InvalidTransformResultException(i);
    value = std::move(*result);
  }
  return value;
}

}  // namespace batchcursor::cursor
