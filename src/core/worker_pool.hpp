/**
 * @file worker_pool.hpp
 * @brief Ограниченный параллельный обход набора задач
 *
 * Короткоживущий пул из min(max_parallel, count) потоков. Потоки берут
 * индексы из атомарного курсора, join служит барьером: после возврата
 * все задачи выполнены. Результаты пишутся в слоты по индексу, поэтому
 * порядок результатов совпадает с порядком входа.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace axectl {

/**
 * @brief parallel_for с заданным способом запуска потоков
 *
 * spawn(worker) возвращает std::thread. Если очередной поток не удалось
 * создать (std::system_error), работу доделывают уже запущенные потоки,
 * а если не запущено ни одного, задачи выполняются в текущем потоке.
 */
template<typename Task, typename Spawn>
void parallel_for_with(std::size_t count, std::size_t max_parallel, Task&& task, Spawn&& spawn) {
    if (count == 0) {
        return;
    }

    std::atomic<std::size_t> cursor{0};
    auto worker = [&]() {
        for (;;) {
            auto index = cursor.fetch_add(1, std::memory_order_relaxed);
            if (index >= count) {
                break;
            }
            task(index);
        }
    };

    auto workers = std::max<std::size_t>(1, std::min(max_parallel, count));
    if (workers == 1) {
        worker();
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (std::size_t w = 0; w < workers; ++w) {
        try {
            threads.push_back(spawn(worker));
        } catch (const std::system_error&) {
            break;
        }
    }

    if (threads.empty()) {
        worker();
    }

    for (auto& thread : threads) {
        thread.join();
    }
}

/**
 * @brief Выполнить task(i) для i в [0, count) не более чем в max_parallel потоках
 *
 * task не должна выбрасывать исключения.
 */
template<typename Task>
void parallel_for(std::size_t count, std::size_t max_parallel, Task&& task) {
    parallel_for_with(count, max_parallel, std::forward<Task>(task),
        [](auto& worker) { return std::thread(std::ref(worker)); });
}

/**
 * @brief Отобразить вход в результаты параллельно, сохраняя порядок
 */
template<typename Result, typename Input, typename Fn>
[[nodiscard]] std::vector<Result> parallel_map(
    const std::vector<Input>& inputs,
    std::size_t max_parallel,
    Fn&& fn
) {
    std::vector<Result> results(inputs.size());
    parallel_for(inputs.size(), max_parallel, [&](std::size_t i) {
        results[i] = fn(inputs[i]);
    });
    return results;
}

} // namespace axectl
