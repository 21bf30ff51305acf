#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "status.hpp"

namespace ecs_logger
{

// 一份已校验的 extra fields：原始 object 与预先渲染好的成员片段
struct ExtraFields
{
  nlohmann::ordered_json object;
  // `"k1":v1,"k2":v2`, insertion order, reserved ECS keys removed, no braces
  std::string members;
};

// Holds at most one extra fields payload shared by every formatter of a
// logger. Set() validates and renders eagerly, outside the lock; readers only
// copy a shared_ptr under a shared lock, so they never block each other and
// always see a whole payload.
class ExtraFieldsStore
{
 public:
  ExtraFieldsStore() = default;
  ExtraFieldsStore(const ExtraFieldsStore&) = delete;
  ExtraFieldsStore& operator=(const ExtraFieldsStore&) = delete;

  // Any type nlohmann can convert (a to_json overload, a json value, a map).
  // Returns SerializationUnsupported and keeps the previous payload when the
  // value is not a JSON object or cannot be serialized.
  template <typename T>
  Status Set(const T& payload);

  Status SetJson(nlohmann::ordered_json value);

  void Clear();

  // nullptr when empty
  std::shared_ptr<const ExtraFields> Snapshot() const;

  bool Empty() const;

 private:
  void Swap(std::shared_ptr<const ExtraFields> fields);

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const ExtraFields> fields_;
};

template <typename T>
Status ExtraFieldsStore::Set(const T& payload)
{
  nlohmann::ordered_json value;
  try
  {
    value = payload;
  }
  catch (const nlohmann::ordered_json::exception&)
  {
    return Status::SerializationUnsupported;
  }
  return SetJson(std::move(value));
}

}  // namespace ecs_logger
