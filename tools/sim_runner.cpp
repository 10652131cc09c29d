// sim_runner - headless level validator and command replayer
//
// Drives LevelSession without a window. Validates catalogs, prints shortest
// solutions, replays scripted commands and runs seeded random command
// streams while checking the position invariants after every step.
//
// Usage:
//   sim_runner [options]
//     --catalog <path>        Level catalog JSON (default: built-in levels)
//     --level <n>             Level, 1-based (default: 1)
//     --commands <script>     Replay a script: L R U D move, A debug-advance,
//                             K acknowledge win (e.g. "RRRK")
//     --solve                 Print the shortest solution of every level
//     --validate              Fail if a level is invalid, unsolvable or over par
//     --random <n>            Send n random commands
//     --seed <hex|dec>        Random stream seed (default: 0xC0FFEE)
//     --export <path>         Write the loaded catalog as JSON
//     --json                  Output as JSON instead of plain text
//     --quiet                 Only output final summary line
//     -h, --help              Print usage

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/Level.hpp"
#include "sim/Session.hpp"
#include "sim/Solver.hpp"

using json = nlohmann::json;

namespace {

struct RunnerArgs {
    std::string catalogPath;
    int levelIndex = 1;
    std::string commands;
    bool solve = false;
    bool validate = false;
    int randomCount = 0;
    uint32_t seed = 0xC0FFEEu;
    std::string exportPath;
    bool json = false;
    bool quiet = false;
    bool help = false;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--catalog") == 0) && i + 1 < argc) {
            args.catalogPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--level") == 0) && i + 1 < argc) {
            args.levelIndex = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--commands") == 0) && i + 1 < argc) {
            args.commands = argv[++i];
        } else if (std::strcmp(argv[i], "--solve") == 0) {
            args.solve = true;
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            args.validate = true;
        } else if ((std::strcmp(argv[i], "--random") == 0) && i + 1 < argc) {
            args.randomCount = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--export") == 0) && i + 1 < argc) {
            args.exportPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "sim_runner - headless MirrorStep level validator\n"
        "\n"
        "Usage: sim_runner [options]\n"
        "  --catalog <path>        Level catalog JSON (default: built-in levels)\n"
        "  --level <n>             Level, 1-based (default: 1)\n"
        "  --commands <script>     L R U D move, A debug-advance, K acknowledge win\n"
        "  --solve                 Print the shortest solution of every level\n"
        "  --validate              Fail if a level is invalid, unsolvable or over par\n"
        "  --random <n>            Send n random commands\n"
        "  --seed <hex|dec>        Random stream seed (default: 0xC0FFEE)\n"
        "  --export <path>         Write the loaded catalog as JSON\n"
        "  --json                  Output as JSON\n"
        "  --quiet                 Only final summary line\n"
        "  -h, --help              This message\n"
    );
}

Command CommandFromScriptChar(const char c) {
    switch (c) {
        case 'L': case 'l': return Command::MoveLeft;
        case 'R': case 'r': return Command::MoveRight;
        case 'U': case 'u': return Command::MoveUp;
        case 'D': case 'd': return Command::MoveDown;
        case 'A': case 'a': return Command::AdvanceLevelDebug;
        case 'K': case 'k': return Command::AcknowledgeWin;
        default:            return Command::None;
    }
}

char ScriptCharFromCommand(const Command c) {
    switch (c) {
        case Command::MoveLeft:          return 'L';
        case Command::MoveRight:         return 'R';
        case Command::MoveUp:            return 'U';
        case Command::MoveDown:          return 'D';
        case Command::AdvanceLevelDebug: return 'A';
        case Command::AcknowledgeWin:    return 'K';
        default:                         return '?';
    }
}

json PosJson(const GridPos& p) {
    return json::array({p.x, p.y});
}

// Players on occupied cells inside their own halves.
bool CheckInvariants(const LevelSession& session) {
    const LevelLayout& layout = session.layout;
    const DualPlayerState& players = session.players;
    return Contains(layout.leftBounds, players.left) &&
           Contains(layout.rightBounds, players.right) &&
           IsOccupied(layout.grid, players.left) &&
           IsOccupied(layout.grid, players.right);
}

// --- Modes ---

int RunValidate(const LevelCatalog& catalog, const RunnerArgs& args, json& out) {
    int failures = 0;
    out["levels"] = json::array();
    for (int i = 0; i < catalog.count; ++i) {
        const LevelDefinition& def = catalog.levels[i];
        json entry;
        entry["index"] = i + 1;
        entry["name"] = def.name;
        entry["par"] = def.par;

        LevelLayout layout{};
        const LayoutError err = BuildLevelLayout(def, layout);
        if (err != LayoutError::None) {
            entry["status"] = "invalid";
            entry["error"] = GetLayoutErrorLabel(err);
            ++failures;
        } else {
            std::vector<Command> solution;
            int visited = 0;
            const bool solvable = SolveLevel(layout, solution, &visited);
            std::string script;
            for (const Command c : solution) script += ScriptCharFromCommand(c);
            entry["states"] = visited;
            if (!solvable) {
                entry["status"] = "unsolvable";
                ++failures;
            } else {
                entry["solution"] = script;
                entry["presses"] = static_cast<int>(solution.size());
                const bool overPar =
                    args.validate && def.par > 0 && static_cast<int>(solution.size()) > def.par;
                entry["status"] = overPar ? "over_par" : "ok";
                if (overPar) ++failures;
            }
        }

        if (!args.quiet && !args.json) {
            std::printf("%2d %-24s %-10s", i + 1, def.name,
                        entry["status"].get<std::string>().c_str());
            if (entry.contains("solution")) {
                std::printf(" %s (%d presses, par %d)",
                            entry["solution"].get<std::string>().c_str(),
                            entry["presses"].get<int>(), def.par);
            } else if (entry.contains("error")) {
                std::printf(" %s", entry["error"].get<std::string>().c_str());
            }
            std::printf("\n");
        }
        out["levels"].push_back(entry);
    }
    return failures;
}

int RunScript(LevelSession& session, const std::string& script, const RunnerArgs& args, json& out) {
    int failures = 0;
    out["steps"] = json::array();
    for (const char ch : script) {
        const Command c = CommandFromScriptChar(ch);
        if (c == Command::None) {
            LOG_WARN("Skipping unknown script command '{}'", ch);
            continue;
        }
        const bool accepted = ApplyCommand(session, c);
        if (!CheckInvariants(session)) {
            LOG_ERROR("Invariant violated after {}", GetCommandLabel(c));
            ++failures;
        }

        json step;
        step["command"] = GetCommandLabel(c);
        step["accepted"] = accepted;
        step["state"] = GetSessionStateLabel(session.state);
        step["level"] = session.levelIndex + 1;
        step["moves"] = session.moveCount;
        step["left"] = PosJson(session.players.left);
        step["right"] = PosJson(session.players.right);
        for (const SessionEvent& ev : DrainEvents(session)) {
            if (ev.type == SessionEventType::WinTriggered) {
                step["win_moves"] = ev.moveCount;
            }
        }

        if (!args.quiet && !args.json) {
            std::printf("%-18s %-4s level %d  L(%d,%d) R(%d,%d)  moves %d  %s\n",
                        GetCommandLabel(c), accepted ? "ok" : "--",
                        session.levelIndex + 1,
                        session.players.left.x, session.players.left.y,
                        session.players.right.x, session.players.right.y,
                        session.moveCount, GetSessionStateLabel(session.state));
        }
        out["steps"].push_back(step);
    }
    return failures;
}

int RunRandom(LevelSession& session, const RunnerArgs& args, json& out) {
    static const Command kPool[] = {
        Command::MoveLeft, Command::MoveRight, Command::MoveUp, Command::MoveDown,
        Command::MoveLeft, Command::MoveRight, Command::MoveUp, Command::MoveDown,
        Command::AcknowledgeWin, Command::AdvanceLevelDebug,
    };
    constexpr uint32_t kPoolSize = sizeof(kPool) / sizeof(kPool[0]);

    uint32_t rng = (args.seed == 0u) ? 1u : args.seed;
    int failures = 0;
    int wins = 0;
    int accepted = 0;
    for (int i = 0; i < args.randomCount; ++i) {
        const Command c = kPool[core::NextBelow(rng, kPoolSize)];
        if (ApplyCommand(session, c)) ++accepted;
        if (!CheckInvariants(session)) {
            LOG_ERROR("Invariant violated at step {} ({})", i, GetCommandLabel(c));
            ++failures;
        }
        for (const SessionEvent& ev : DrainEvents(session)) {
            if (ev.type == SessionEventType::WinTriggered) ++wins;
        }
    }

    out["random"] = {
        {"commands", args.randomCount},
        {"accepted", accepted},
        {"wins", wins},
        {"violations", failures},
        {"final_level", session.levelIndex + 1},
    };
    if (!args.quiet && !args.json) {
        std::printf("random: %d commands, %d accepted, %d wins, %d violations\n",
                    args.randomCount, accepted, wins, failures);
    }
    return failures;
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }

    Log::Init("sim_runner.log");
    Log::SetConsoleLevel((args.quiet || args.json) ? spdlog::level::err
                                                   : spdlog::level::warn);

    // Static: the catalog is too big to be a comfortable stack object.
    static LevelCatalog catalog{};
    if (args.catalogPath.empty()) {
        catalog = GetBuiltinCatalog();
    } else if (!LoadCatalogFromFile(catalog, args.catalogPath.c_str())) {
        std::fprintf(stderr, "Failed to load catalog %s\n", args.catalogPath.c_str());
        Log::Shutdown();
        return 2;
    }

    json out;
    out["catalog"] = args.catalogPath.empty() ? "builtin" : args.catalogPath;
    out["level_count"] = catalog.count;
    int failures = 0;

    if (!args.exportPath.empty() && !SaveCatalogToFile(catalog, args.exportPath.c_str())) {
        ++failures;
    }

    if (args.solve || args.validate) {
        failures += RunValidate(catalog, args, out);
    }

    if (!args.commands.empty() || args.randomCount > 0) {
        static LevelSession session{};
        const LayoutError err = StartSession(session, catalog, args.levelIndex - 1);
        if (err != LayoutError::None) {
            std::fprintf(stderr, "Level %d failed to load: %s\n", args.levelIndex,
                         GetLayoutErrorLabel(err));
            Log::Shutdown();
            return 2;
        }
        DrainEvents(session);
        if (!args.commands.empty()) failures += RunScript(session, args.commands, args, out);
        if (args.randomCount > 0) failures += RunRandom(session, args, out);
    }

    out["failures"] = failures;
    if (args.json) {
        std::printf("%s\n", out.dump(2).c_str());
    } else {
        std::printf("sim_runner: %d level(s), %d failure(s)\n", catalog.count, failures);
    }

    Log::Shutdown();
    return (failures == 0) ? 0 : 1;
}
