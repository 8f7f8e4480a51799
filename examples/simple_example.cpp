/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <iostream>
#include <vector>
#include "tabula/tabula.h"

int main() {
    try {
        std::cout << "Tabula Simple Example\n";
        std::cout << "=====================\n\n";

        // Build a table from records, columns come from the first row
        tabula::Table users(std::vector<tabula::Record>{
            tabula::Record{{"id", 1}, {"name", "Alice"}, {"age", 31}},
            tabula::Record{{"id", 2}, {"name", "Bob"},   {"age", 27}},
        });
        users.addRow(tabula::Record{{"id", 3}, {"name", "Carol"}});

        std::cout << "Created table with " << users.getColumnCount() << " columns:\n";
        for (const auto& column : users.getColumns()) {
            std::cout << "  " << column << "\n";
        }
        std::cout << "Rows: " << users.getRowCount() << "\n\n";

        // Type consistency is enforced per column
        try {
            users.setValue(2, "age", "unknown");
        } catch (const tabula::TypeConsistencyError& e) {
            std::cout << "Rejected write: " << e.what() << "\n\n";
        }

        // Validation
        std::cout << "id unique:      " << (users.isNotDuplColumn("id") ? "yes" : "no") << "\n";
        std::cout << "age complete:   " << (users.isNotNullColumn("age") ? "yes" : "no") << "\n";
        auto missing = users.findFirstRowNullColumn("age");
        if (missing) {
            std::cout << "first row without age: " << tabula::Value(*missing) << "\n";
        }
        std::cout << "\n";

        // Sort by age, nulls go last when ascending
        users.sortRowAscending("age");
        std::cout << "Sorted by age:\n";
        for (const auto& row : users.getRows()) {
            std::cout << "  " << tabula::Value(row) << "\n";
        }
        std::cout << "\n";

        // Wrap the table together with scalar parameters and serialize
        tabula::Wrapper request;
        request.put("action", "saveUsers")
               .put("page", 1)
               .put("users", users);
        const std::string text = request.getSerialized();
        std::cout << "Serialized request:\n  " << text << "\n\n";

        // Rehydrate the request from its text form
        tabula::Wrapper restored = tabula::Wrapper::fromSerialized(text);
        tabula::Table restoredUsers = restored.getTable("users");
        std::cout << "Restored " << restoredUsers.getRowCount() << " rows, action = "
                  << restored.getString("action").value_or("<null>") << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
