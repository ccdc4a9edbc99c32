#pragma once

#include <tandem/execution/engine.hpp>
#include <tandem/schema/primitives.hpp>
#include <tandem/storage/rocksdb/storage.hpp>
#include <tandem/testing/common.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace tandem::testing {

using scale_encoder_t = tandem::schema::encoding::scale_encoder_t;
using storage_t =
    tandem::storage::storage<tandem::storage::rocksdb_storage_tag>;

/// Engine over a private temporary RocksDB store. `reopen()` closes the
/// engine and store and opens both again on the same directory.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          tandem::execution::address_deriver_t deriver =
                              tandem::execution::default_address_deriver())
      : db_dir_{db_prefix}, deriver_{std::move(deriver)} {
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  // The engine and store close before `db_dir_` removes the directory.
  ~engine_fixture() {
    engine_.reset();
    storage_.reset();
  }

  storage_t& storage() { return *storage_; }
  tandem::execution::engine& engine() { return *engine_; }

  void reopen() {
    engine_.reset();
    storage_.reset();
    open();
  }

 private:
  void open() {
    storage_ = std::make_unique<storage_t>(
        tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
            db_dir_.path()));
    engine_ = std::make_unique<tandem::execution::engine>(encoder_, *storage_,
                                                          deriver_);
  }

  temp_db_dir db_dir_;
  tandem::execution::address_deriver_t deriver_;
  scale_encoder_t encoder_;
  std::unique_ptr<storage_t> storage_;
  std::unique_ptr<tandem::execution::engine> engine_;
};

}  // namespace tandem::testing
