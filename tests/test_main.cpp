#define CATCH_CONFIG_RUNNER
#include <catch2/catch_session.hpp> // Pour Catch::Session
#include <spdlog/spdlog.h>          // Pour spdlog

// Notre propre fonction main
int main( int argc, char* argv[] ) {
    // Les simulations journalisent beaucoup en info : on ne garde que les avertissements
    spdlog::set_level(spdlog::level::warn);

    // Initialisation de Catch2
    Catch::Session session;

    // Lancer la session de tests Catch2
    int result = session.run( argc, argv );

    return result;
}
