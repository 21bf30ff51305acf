#include "ecs_logger/extra_fields.hpp"

#include <mutex>

#include "ecs_logger/ecs_fields.hpp"

namespace ecs_logger
{

Status ExtraFieldsStore::SetJson(nlohmann::ordered_json value)
{
  if (!value.is_object())
  {
    return Status::SerializationUnsupported;
  }

  auto fields = std::make_shared<ExtraFields>();
  try
  {
    for (auto it = value.cbegin(); it != value.cend(); ++it)
    {
      if (ecs::is_reserved_key(it.key()))
      {
        continue;
      }
      if (!fields->members.empty())
      {
        fields->members += ',';
      }
      // strict 模式下非法 UTF-8 会抛 type_error
      fields->members += nlohmann::ordered_json(it.key()).dump();
      fields->members += ':';
      fields->members += it.value().dump();
    }
  }
  catch (const nlohmann::ordered_json::exception&)
  {
    return Status::SerializationUnsupported;
  }
  fields->object = std::move(value);

  Swap(std::move(fields));
  return Status::Ok;
}

void ExtraFieldsStore::Clear() { Swap(nullptr); }

std::shared_ptr<const ExtraFields> ExtraFieldsStore::Snapshot() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return fields_;
}

bool ExtraFieldsStore::Empty() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return fields_ == nullptr;
}

void ExtraFieldsStore::Swap(std::shared_ptr<const ExtraFields> fields)
{
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    fields_.swap(fields);
  }
  // 旧 payload 在锁外释放
}

}  // namespace ecs_logger
