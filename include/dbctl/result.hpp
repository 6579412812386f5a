// Copyright (c) 2024 liudegui. MIT License.
//
// dbctl::Result -- outcome of an executed statement.

#pragma once

#include <cstdint>

#include "dbctl/error.hpp"
#include "dbctl/failure.hpp"

namespace dbctl {

class Result {
 public:
  Result() = default;

  Result(int64_t last_insert_id, int64_t rows_affected)
      : valid_(true),
        last_insert_id_(last_insert_id),
        rows_affected_(rows_affected) {}

  /// Throws DriverError if no statement produced this result.
  int64_t LastInsertId() const {
    CheckValid("LastInsertId");
    return last_insert_id_;
  }

  /// Throws DriverError if no statement produced this result.
  int64_t RowsAffected() const {
    CheckValid("RowsAffected");
    return rows_affected_;
  }

  bool Valid() const { return valid_; }

 private:
  void CheckValid(const char* what) const {
    if (!valid_) {
      throw DriverError(
          Error::Make(ErrorCode::kMisuse, "no execution result available"),
          what);
    }
  }

  bool valid_ = false;
  int64_t last_insert_id_ = 0;
  int64_t rows_affected_ = 0;
};

}  // namespace dbctl
