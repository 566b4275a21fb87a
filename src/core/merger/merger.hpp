#pragma once

#include <filesystem>
#include <vector>
#include "../model/transfer_types.hpp"
#include "../../extensions/resumer.hpp"
#include "../../infra/error_handler/error.hpp"

namespace segdl::core {

// Проверяет каждый файл сегмента по порядку (существует, размер строго равен
// плановому) и склеивает их в destination. Любое расхождение: Corruption,
// файлы сегментов при этом не трогаются и частичный результат не создаётся.
// После успеха удаляет сегменты и resume-запись через store.
//
// Вызывать только когда все воркеры остановлены и ошибок нет.
[[nodiscard]] auto merge_segments(const std::vector<Segment>& segments,
                                  const std::filesystem::path& parts_dir,
                                  const std::filesystem::path& destination,
                                  extensions::ResumeStore& store) -> infra::VoidResult;

// Только проверка размеров, без склейки
[[nodiscard]] auto validate_segments(const std::vector<Segment>& segments,
                                     const std::filesystem::path& parts_dir) -> infra::VoidResult;

} // namespace segdl::core
