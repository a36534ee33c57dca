#include <tether/tether.hpp>
#include <inventory/models.hpp>
#include <inventory/summary.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace tether;
using namespace tether::inventory;

namespace {

std::vector<std::string> split(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

size_t parse_row(const std::string& text) {
    size_t used = 0;
    auto row = std::stoul(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument("Not a row number: " + text);
    }
    return row;
}

void print_help() {
    std::cout <<
        "list <products|orders>                 show a table\n"
        "add <table> [field=value...]           append a new row\n"
        "edit <table> <row> field=value...      change cells of a row\n"
        "delete <table> <row>...                delete rows\n"
        "save <table>                           store every edited row\n"
        "choices orders product_id              list products to pick from\n"
        "summary                                stock left per product\n"
        "help                                   this text\n"
        "quit                                   leave\n";
}

template<typename E>
class table_commands {
public:
    explicit table_commands(observable_collection<E>& collection)
        : collection_(collection)
        , edits_(collection) {}

    void list() const {
        const auto& props = collection_.descriptor()->properties();
        std::cout << "#";
        for (const auto& prop : props) {
            std::cout << "\t" << prop.name;
        }
        std::cout << "\n";
        for (size_t row = 0; row < collection_.size(); ++row) {
            const auto& vm = collection_[row];
            std::cout << row;
            for (const auto& prop : props) {
                std::cout << "\t" << format_value(vm->get(prop.name));
            }
            if (edits_.is_tracked(*vm)) {
                std::cout << "\t*";
            }
            std::cout << "\n";
        }
    }

    void add(const std::vector<std::string>& assignments) {
        auto vm = edits_.add_row();
        apply(vm, assignments);
        std::cout << "added row " << collection_.size() - 1 << "\n";
    }

    void edit(size_t row, const std::vector<std::string>& assignments) {
        if (assignments.empty()) {
            throw std::invalid_argument("Nothing to edit");
        }
        apply(collection_.at(row), assignments);
    }

    void remove(const std::vector<size_t>& rows) {
        edits_.remove_rows(rows);
        std::cout << "deleted " << rows.size() << " row(s)\n";
    }

    void save() {
        auto count = edits_.pending_count();
        edits_.save();
        std::cout << "saved " << count << " row(s)\n";
    }

    void choices(const std::string& property) {
        auto list = choice_list::load(collection_.repo(), *collection_.descriptor(), property);
        if (list.empty()) {
            std::cout << "no choices for " << property << "\n";
            return;
        }
        for (size_t i = 0; i < list.size(); ++i) {
            std::cout << i << "\t" << list.at(i).label << "\t(" << list.key_at(i) << ")\n";
        }
    }

private:
    observable_collection<E>& collection_;
    edit_session<E> edits_;

    void apply(const view_model_ptr& vm, const std::vector<std::string>& assignments) {
        for (const auto& assignment : assignments) {
            auto eq = assignment.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("Expected field=value, got " + assignment);
            }
            edits_.edit_text(vm, assignment.substr(0, eq), assignment.substr(eq + 1));
        }
    }
};

class inventory_shell {
public:
    inventory_shell(observable_collection<Product>& products,
                    observable_collection<Order>& orders,
                    stock_summary& summary)
        : products_(products)
        , orders_(orders)
        , summary_(summary) {}

    /// false once the user asked to quit
    bool execute(const std::vector<std::string>& words) {
        const auto& command = words.front();
        if (command == "quit" || command == "exit") return false;

        if (command == "help") {
            print_help();
        } else if (command == "summary") {
            for (const auto& line : summary_.lines()) {
                std::cout << line << "\n";
            }
        } else if (command == "choices") {
            require(words, 3);
            if (words[1] != "orders") {
                throw std::invalid_argument("Only orders have choices");
            }
            orders_.choices(words[2]);
        } else if (command == "list") {
            require(words, 2);
            dispatch(words[1], [](auto& table) { table.list(); });
        } else if (command == "add") {
            require(words, 2);
            std::vector<std::string> assignments(words.begin() + 2, words.end());
            dispatch(words[1], [&](auto& table) { table.add(assignments); });
        } else if (command == "edit") {
            require(words, 4);
            auto row = parse_row(words[2]);
            std::vector<std::string> assignments(words.begin() + 3, words.end());
            dispatch(words[1], [&](auto& table) { table.edit(row, assignments); });
        } else if (command == "delete") {
            require(words, 3);
            std::vector<size_t> rows;
            for (auto it = words.begin() + 2; it != words.end(); ++it) {
                rows.push_back(parse_row(*it));
            }
            dispatch(words[1], [&](auto& table) { table.remove(rows); });
        } else if (command == "save") {
            require(words, 2);
            dispatch(words[1], [](auto& table) { table.save(); });
        } else {
            throw std::invalid_argument("Unknown command " + command + " (try help)");
        }
        return true;
    }

private:
    table_commands<Product> products_;
    table_commands<Order> orders_;
    stock_summary& summary_;

    static void require(const std::vector<std::string>& words, size_t count) {
        if (words.size() < count) {
            throw std::invalid_argument("Missing arguments for " + words.front());
        }
    }

    template<typename F>
    void dispatch(const std::string& table, F&& action) {
        if (table == entity_traits<Product>::schema().table_name) {
            action(products_);
        } else if (table == entity_traits<Order>::schema().table_name) {
            action(orders_);
        } else {
            throw std::invalid_argument("Unknown table " + table);
        }
    }
};

} // namespace

int main(int argc, char* argv[]) {
    configuration config;
    try {
        if (argc > 1) {
            config = load_configuration(argv[1]);
        }
    } catch (const config_error& e) {
        std::cerr << "tether_inventory: " << e.what() << std::endl;
        return 1;
    }
    set_log_level(config.level);

    try {
        auto db = open_database(config);

        entity_registry registry;
        register_inventory(registry);
        registry.create_all(*db);

        event_bus bus;
        view_model_factory factory(registry);
        repository repo(db, factory, bus);

        observable_collection<Product> products(repo);
        observable_collection<Order> orders(repo);
        products.load_all();
        orders.load_all();

        stock_summary summary(products);
        inventory_shell shell(products, orders, summary);

        std::cout << "tether inventory on " << config.path << " (help for commands)\n";
        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
            auto words = split(line);
            if (words.empty()) continue;
            try {
                if (!shell.execute(words)) break;
            } catch (const model_error& e) {
                std::cout << "error: " << e.what() << "\n";
            } catch (const db_error& e) {
                std::cout << "storage error: " << e.what() << "\n";
            } catch (const std::invalid_argument& e) {
                std::cout << "error: " << e.what() << "\n";
            } catch (const std::out_of_range& e) {
                std::cout << "error: no such row (" << e.what() << ")\n";
            }
        }
    } catch (const db_error& e) {
        std::cerr << "tether_inventory: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
