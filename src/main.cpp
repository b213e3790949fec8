/**
 * @file main.cpp
 * @brief Точка входа incmerkle
 *
 * incmerkle - инкрементальный Keccak-256 Merkle аккумулятор глубины 32
 * с хранением frontier в key-value хранилище.
 *
 * Использование:
 *   incmerkle [options] <command> [args...]
 *
 * Команды:
 *   insert <leaf>...                         Добавить листья
 *   root                                     Корень дерева
 *   tree                                     Счётчик и branch
 *   branch-root <leaf> <index> [sibling...]  Корень по доказательству
 *   verify <leaf> <index> <root> [sibling...] Проверить доказательство
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   --legacy-padding     Дополнять короткие доказательства нулями
 *   --test-config        Проверить конфигурацию и выйти
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"
#include "accumulator/accumulator.hpp"
#include "storage/kv_store.hpp"
#include "storage/tree_store.hpp"
#include "log/event_log.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
incmerkle v)" << VERSION << R"(
Инкрементальный Keccak-256 Merkle аккумулятор

ИСПОЛЬЗОВАНИЕ:
    incmerkle [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]

КОМАНДЫ:
    insert <leaf>...                           Добавить листья (hex, 32 байта)
    root                                       Вывести корень дерева
    tree                                       Вывести счётчик и branch
    branch-root <leaf> <index> [sibling...]    Вычислить корень по доказательству
    verify <leaf> <index> <root> [sibling...]  Проверить доказательство

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (incmerkle.toml)
    --legacy-padding     Дополнять короткие доказательства нулевыми соседями
    --test-config        Проверить конфигурацию и выйти
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы

ПРИМЕРЫ:
    incmerkle insert 0x01...
    incmerkle -c /etc/incmerkle/incmerkle.toml root

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "incmerkle v" << VERSION << std::endl;
    std::cout << "Глубина дерева по умолчанию: " << incmerkle::constants::TREE_DEPTH << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool legacy_padding = false;
    std::vector<std::string> positional;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--legacy-padding") {
            args.legacy_padding = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else {
            args.positional.emplace_back(arg);
        }
    }

    return args;
}

incmerkle::Result<uint64_t> parse_index(std::string_view text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return incmerkle::Err<uint64_t>(
            incmerkle::ErrorCode::InvalidProof,
            std::format("Некорректный индекс листа: '{}'", text)
        );
    }
    return value;
}

incmerkle::Result<std::vector<incmerkle::Hash256>> parse_hashes(
    const std::vector<std::string>& items,
    std::size_t first
) {
    std::vector<incmerkle::Hash256> hashes;
    for (std::size_t i = first; i < items.size(); ++i) {
        auto hash = incmerkle::core::parse_hash(items[i]);
        if (!hash) {
            return std::unexpected(hash.error());
        }
        hashes.push_back(*hash);
    }
    return hashes;
}

void print_error(const incmerkle::Error& error) {
    std::cerr << "[ERROR] " << to_string(error.code) << ": " << error.message << std::endl;
}

/**
 * @brief Выполнить команду над аккумулятором
 *
 * @return Код возврата процесса
 */
int run_command(
    const Args& args,
    const incmerkle::Config& config,
    incmerkle::Accumulator& accumulator
) {
    using namespace incmerkle;

    const auto& command = args.positional.front();
    const auto policy = args.legacy_padding ? core::ProofPolicy::ZeroPadded
                                            : core::ProofPolicy::Strict;

    if (command == "insert") {
        if (args.positional.size() < 2) {
            std::cerr << "[ERROR] insert: не указан лист" << std::endl;
            return 2;
        }
        auto leaves = parse_hashes(args.positional, 1);
        if (!leaves) {
            print_error(leaves.error());
            return 2;
        }
        for (const auto& leaf : *leaves) {
            auto frontier = accumulator.insert(leaf);
            if (!frontier) {
                print_error(frontier.error());
                return 1;
            }
            std::cout << frontier->count() - 1 << " " << core::to_hex(leaf) << std::endl;
        }
        return 0;
    }

    if (command == "root") {
        auto root = accumulator.get_root();
        if (!root) {
            print_error(root.error());
            return 1;
        }
        std::cout << core::to_hex(*root) << std::endl;
        return 0;
    }

    if (command == "tree") {
        auto frontier = accumulator.get_tree();
        if (!frontier) {
            print_error(frontier.error());
            return 1;
        }
        std::cout << "depth " << frontier->depth() << std::endl;
        std::cout << "count " << frontier->count() << std::endl;
        for (std::size_t i = 0; i < frontier->branch().size(); ++i) {
            std::cout << "branch[" << i << "] " << core::to_hex(frontier->branch()[i]) << std::endl;
        }
        return 0;
    }

    if (command == "branch-root" || command == "verify") {
        const bool verify = command == "verify";
        const std::size_t first_sibling = verify ? 4 : 3;
        if (args.positional.size() < first_sibling) {
            std::cerr << "[ERROR] " << command << ": недостаточно аргументов" << std::endl;
            return 2;
        }

        auto leaf = core::parse_hash(args.positional[1]);
        if (!leaf) {
            print_error(leaf.error());
            return 2;
        }
        auto index = parse_index(args.positional[2]);
        if (!index) {
            print_error(index.error());
            return 2;
        }
        auto siblings = parse_hashes(args.positional, first_sibling);
        if (!siblings) {
            print_error(siblings.error());
            return 2;
        }

        auto root = Accumulator::branch_root(*leaf, *siblings, *index, policy, config.tree.depth);
        if (!root) {
            print_error(root.error());
            return 1;
        }

        if (!verify) {
            std::cout << core::to_hex(*root) << std::endl;
            return 0;
        }

        auto expected = core::parse_hash(args.positional[3]);
        if (!expected) {
            print_error(expected.error());
            return 2;
        }
        if (*root != *expected) {
            std::cout << "mismatch " << core::to_hex(*root) << std::endl;
            return 1;
        }
        std::cout << "ok" << std::endl;
        return 0;
    }

    std::cerr << "[ERROR] Неизвестная команда: " << command << std::endl;
    return 2;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace incmerkle;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Без файла конфигурации используются значения по умолчанию
    Config config;
    auto config_result = Config::load_with_search(args.config_path);
    if (config_result) {
        config = *config_result;
    } else if (args.config_path || config_result.error().code != ErrorCode::ConfigNotFound) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    if (args.test_config) {
        std::cout << "[INFO] Конфигурация валидна" << std::endl;
        return 0;
    }

    if (args.positional.empty()) {
        print_help();
        return 2;
    }

    log::EventLog events(config.logging);

    // Создаём хранилище
    std::unique_ptr<storage::KeyValueStore> kv;
    if (config.storage.backend == "memory") {
        kv = std::make_unique<storage::MemoryStore>();
    } else {
        auto file_store = storage::FileStore::open(config.storage.path);
        if (!file_store) {
            events.error(log::EventType::StorageError, file_store.error().message);
            print_error(file_store.error());
            return 1;
        }
        kv = std::move(*file_store);
    }

    storage::TreeStore tree_store(*kv, config.storage.key, config.tree.depth);
    Accumulator accumulator(tree_store, &events);

    try {
        return run_command(args, config, accumulator);
    } catch (const InternalFault& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 3;
    }
}
