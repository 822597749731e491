#include "cliffkp/core/runner.hpp"

int main(int argc, char *argv[]) {
    // 1. Instancia o Runner
    cliffkp::Runner runner;

    // 2. Inicializa (Lê CLI, Config, instância e candidatos)
    int status = runner.init(argc, argv);

    // --help encerra com sucesso, erros de CLI ou de leitura encerram com falha
    if (status != 0) return (status > 0) ? 0 : 1;

    // 3. Avalia
    return runner.run();
}
