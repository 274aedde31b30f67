#include "backend/languages.hpp"
#include "backend/compiled.hpp"
#include "backend/in_process.hpp"
#include "backend/interpreter.hpp"
#include "backend/sql.hpp"

namespace sandbox {
using namespace std;
using namespace std::chrono_literals;

void register_default_backends(backend_registry &registry) {
    registry.add(make_unique<embedded_python_backend>(2000ms));
    registry.add(make_unique<python_interpreter_backend>(3000ms));

    registry.add(make_unique<javascript_backend>(3000ms));

    registry.add(make_unique<compiled_backend>(compiled_language{
        "c", "C", "main.c", "app.out",
        {{"gcc", {"{source}", "-O0", "-std=c11", "-o", "{output}"}}}, 5000ms,
        {"{output}", {}}, 2500ms}));

    registry.add(make_unique<compiled_backend>(compiled_language{
        "cpp", "C++", "main.cpp", "app.out",
        {{"g++", {"{source}", "-O0", "-std=c++17", "-o", "{output}"}}}, 5000ms,
        {"{output}", {}}, 2500ms}));

    registry.add(make_unique<java_backend>(6000ms, 3000ms));

    registry.add(make_unique<interpreter_backend>(interpreted_language{
        "go", "Go", "main.go", {"go", {"run", "{source}"}}, 5000ms}));

    registry.add(make_unique<interpreter_backend>(interpreted_language{
        "ruby", "Ruby", "main.rb", {"ruby", {"{source}"}}, 4000ms}));

    registry.add(make_unique<interpreter_backend>(interpreted_language{
        "php", "PHP", "main.php", {"php", {"{source}"}}, 4000ms}));

    registry.add(make_unique<compiled_backend>(compiled_language{
        "csharp", "C#", "Program.cs", "app.exe",
        {{"mcs", {"{source}", "-out:{output}"}}, {"csc", {"{source}", "/out:{output}"}}}, 6000ms,
        {"mono", {"{output}"}}, 4000ms}));

    registry.add(make_unique<sql_backend>(4500ms));
}

}  // namespace sandbox
