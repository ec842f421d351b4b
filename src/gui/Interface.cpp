#include "Interface.hpp"
#include "imgui.h"
#include "imgui-SFML.h"
#include <SFML/Graphics.hpp>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <future>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "ChessCore.hpp"
#include "Setup.hpp"

const int BOARD_PIXEL_TARGET = 720;
const int BOARD_PADDING = 30;
const int PANEL_WIDTH = 320;

struct Assets {
    sf::Font font;
    std::map<int, sf::Texture> textures;
    bool has_font = false;
    void load() {
        if (font.loadFromFile("assets/font.TTF")) has_font = true;
        auto load_piece = [&](int id, std::string filename) {
            sf::Texture tex;
            if (tex.loadFromFile("assets/" + filename)) {
                tex.setSmooth(true); textures[id] = tex;
            }
        };
        load_piece(1, "Chess_plt45.png"); load_piece(2, "Chess_nlt45.png");
        load_piece(3, "Chess_blt45.png"); load_piece(4, "Chess_rlt45.png");
        load_piece(5, "Chess_qlt45.png"); load_piece(6, "Chess_klt45.png");
        load_piece(-1, "Chess_pdt45.png"); load_piece(-2, "Chess_ndt45.png");
        load_piece(-3, "Chess_bdt45.png"); load_piece(-4, "Chess_rdt45.png");
        load_piece(-5, "Chess_qdt45.png"); load_piece(-6, "Chess_kdt45.png");
    }
};

// Texture id: 1..6 for white pawn..king, negative for black.
int texture_id(const Piece& p) {
    int id = 0;
    switch (p.type) {
        case PieceType::Pawn:   id = 1; break;
        case PieceType::Knight: id = 2; break;
        case PieceType::Bishop: id = 3; break;
        case PieceType::Rook:   id = 4; break;
        case PieceType::Queen:  id = 5; break;
        case PieceType::King:   id = 6; break;
    }
    return p.colour == Colour::White ? id : -id;
}

struct BoardView {
    int size = 8;
    float tile = 75.0f;
    bool flipped = false;

    sf::Vector2f origin(Coord sq) const {
        int col = flipped ? (size - 1 - sq.file) : sq.file;
        int row = flipped ? sq.rank : (size - 1 - sq.rank);
        return {BOARD_PADDING + col * tile, BOARD_PADDING + row * tile};
    }

    std::optional<Coord> square_at(int mouse_x, int mouse_y) const {
        float x = static_cast<float>(mouse_x - BOARD_PADDING);
        float y = static_cast<float>(mouse_y - BOARD_PADDING);
        if (x < 0 || y < 0) return std::nullopt;
        int col = static_cast<int>(x / tile);
        int row = static_cast<int>(y / tile);
        if (col >= size || row >= size) return std::nullopt;
        int file = flipped ? (size - 1 - col) : col;
        int rank = flipped ? row : (size - 1 - row);
        return Coord{file, rank};
    }
};

const char* state_text(GameState state) {
    switch (state) {
        case GameState::Playing:     return "";
        case GameState::WhiteWins:   return "White Wins!";
        case GameState::BlackWins:   return "Black Wins!";
        case GameState::Stalemate:   return "Stalemate";
        case GameState::DrawByClock: return "Draw (100 moves without capture or pawn move)";
    }
    return "";
}

namespace GUI {
    void Launch(const LaunchOptions& options) {
        const int win_width = BOARD_PIXEL_TARGET + 2 * BOARD_PADDING + PANEL_WIDTH;
        const int win_height = BOARD_PIXEL_TARGET + 2 * BOARD_PADDING;
        sf::RenderWindow window(sf::VideoMode(win_width, win_height), "GrandChess");
        window.setFramerateLimit(60);
        ImGui::SFML::Init(window);

        ChessCore game;
        int board_size = options.board_size;
        SetupMode mode = options.mode;
        Search::Difficulty difficulty = options.difficulty;
        int human_side_int = options.human_side;

        auto start_game = [&]() {
            SetupResult result = game.new_game(mode, board_size);
            if (!result.success) {
                for (const auto& e : result.errors) std::cerr << "Setup failed: " << e << std::endl;
                mode = SetupMode::TwoLines;
                board_size = DEFAULT_BOARD_SIZE;
                game.new_game(mode, board_size);
            }
        };

        if (!options.fen.empty()) {
            ParseResult result = game.fen(options.fen);
            if (!result.success) {
                std::cerr << "FEN rejected: " << result.error << std::endl;
                start_game();
            }
            board_size = game.get_board_state().size;
        } else {
            start_game();
        }

        Assets assets; assets.load();
        BoardView view;
        std::optional<Coord> selected_sq;
        std::vector<Coord> valid_moves;
        std::optional<Coord> checked_king;
        std::vector<std::string> history;
        sf::Clock deltaClock;

        char fen_buffer[8192] = {0};
        std::string fen_status;

        // --- BOT STATE ---
        std::future<std::optional<Move>> bot_future;
        bool is_thinking = false;

        auto human_moves = [&]() {
            Colour to_move = game.get_board_state().to_move;
            if (human_side_int == 2) return false;
            return (human_side_int == 0) == (to_move == Colour::White);
        };

        auto record = [&](const MoveOutcome& outcome) {
            if (!outcome.notation.empty()) history.push_back(outcome.notation);
            checked_king = outcome.checked_king;
            if (outcome.state != GameState::Playing) {
                std::cout << "Game over: " << state_text(outcome.state) << std::endl;
            }
        };

        auto clear_selection = [&]() { selected_sq.reset(); valid_moves.clear(); };

        auto render_board = [&]() {
            const BoardState& board = game.get_board_state();
            view.size = board.size;
            view.tile = static_cast<float>(BOARD_PIXEL_TARGET) / board.size;

            sf::RectangleShape tile(sf::Vector2f(view.tile, view.tile));
            for (int r = 0; r < board.size; ++r) {
                for (int f = 0; f < board.size; ++f) {
                    bool is_light = ((r + f) % 2 != 0);
                    tile.setFillColor(is_light ? sf::Color(240, 217, 181) : sf::Color(181, 136, 99));
                    tile.setPosition(view.origin({f, r})); window.draw(tile);
                }
            }

            auto draw_hl = [&](Coord sq, sf::Color c) {
                tile.setPosition(view.origin(sq)); tile.setFillColor(c); window.draw(tile);
            };
            if (checked_king) draw_hl(*checked_king, sf::Color(255, 0, 0, 120));
            if (!game.is_awaiting_promotion() && selected_sq) {
                draw_hl(*selected_sq, sf::Color(255, 255, 0, 100));
                for (const auto& to : valid_moves) draw_hl(to, sf::Color(100, 255, 100, 100));
            }

            for (int r = 0; r < board.size; ++r) {
                for (int f = 0; f < board.size; ++f) {
                    const auto& cell = board.at({f, r});
                    if (!cell) continue;
                    sf::Vector2f pos = view.origin({f, r});
                    float cx = pos.x + view.tile / 2.0f, cy = pos.y + view.tile / 2.0f;
                    int id = texture_id(*cell);
                    if (assets.textures.count(id)) {
                        sf::Sprite s(assets.textures[id]);
                        float sc = (view.tile * 0.85f) / s.getLocalBounds().width;
                        s.setScale(sc, sc); s.setOrigin(s.getLocalBounds().width/2, s.getLocalBounds().height/2);
                        s.setPosition(cx, cy); window.draw(s);
                    } else {
                        // No piece art: a disc with the piece letter.
                        float radius = view.tile * 0.4f;
                        sf::CircleShape disc(radius);
                        disc.setOrigin(radius, radius);
                        disc.setPosition(cx, cy);
                        bool white = cell->colour == Colour::White;
                        disc.setFillColor(white ? sf::Color(250, 250, 250) : sf::Color(40, 40, 40));
                        disc.setOutlineColor(sf::Color(90, 90, 90)); disc.setOutlineThickness(1.0f);
                        window.draw(disc);
                        if (assets.has_font) {
                            sf::Text label(std::string(1, piece_letter(cell->type)), assets.font,
                                           static_cast<unsigned>(std::max(8.0f, view.tile * 0.5f)));
                            label.setFillColor(white ? sf::Color::Black : sf::Color::White);
                            sf::FloatRect b = label.getLocalBounds();
                            label.setOrigin(b.left + b.width / 2, b.top + b.height / 2);
                            label.setPosition(cx, cy); window.draw(label);
                        }
                    }
                }
            }
        };

        while (window.isOpen()) {
            sf::Event event;
            while (window.pollEvent(event)) {
                ImGui::SFML::ProcessEvent(window, event);
                if (event.type == sf::Event::Closed) window.close();

                // HUMAN INPUT (Only if not thinking, not promoting & game still running)
                bool accepting = human_moves() && !is_thinking && !game.is_awaiting_promotion() &&
                                 game.get_game_state() == GameState::Playing;
                if (!accepting) continue;
                if (event.type != sf::Event::MouseButtonPressed || event.mouseButton.button != sf::Mouse::Left) continue;
                if (ImGui::GetIO().WantCaptureMouse) continue;

                std::optional<Coord> clicked = view.square_at(event.mouseButton.x, event.mouseButton.y);
                if (!clicked) continue;

                if (selected_sq && std::find(valid_moves.begin(), valid_moves.end(), *clicked) != valid_moves.end()) {
                    MoveOutcome outcome = game.try_make_move(*selected_sq, *clicked);
                    clear_selection();
                    if (outcome.success) record(outcome);
                    continue;
                }

                std::vector<Coord> moves = game.legal_moves(*clicked);
                if (!moves.empty()) {
                    selected_sq = clicked; valid_moves = std::move(moves);
                } else {
                    clear_selection();
                }
            }

            ImGui::SFML::Update(window, deltaClock.restart());

            // --- SIDEBAR UI ---
            ImGui::SetNextWindowPos(ImVec2(static_cast<float>(win_width - PANEL_WIDTH), 0));
            ImGui::SetNextWindowSize(ImVec2(static_cast<float>(PANEL_WIDTH), static_cast<float>(win_height)));
            ImGui::Begin("Controls", nullptr, ImGuiWindowFlags_NoDecoration);

            const BoardState& board = game.get_board_state();
            if (game.get_game_state() != GameState::Playing) {
                ImGui::TextColored(ImVec4(1, 0, 0, 1), "GAME OVER");
                ImGui::TextColored(ImVec4(0, 1, 0, 1), "%s", state_text(game.get_game_state()));
                ImGui::Separator();
            }

            ImGui::TextColored(ImVec4(1,1,0,1), "GAME STATUS");
            ImGui::Separator();
            ImGui::Text("Turn: %s", (board.to_move == Colour::White ? "White" : "Black"));
            ImGui::Text("Move #: %d", board.full_move_number);
            ImGui::Text("Board: %dx%d (%s)", board.size, board.size, Setup::mode_name(board.setup_mode));
            ImGui::Text("Status: %s", is_thinking ? "THINKING..." : "Waiting");

            // Promotion choice for the human side.
            if (game.is_awaiting_promotion()) {
                ImGui::Spacing();
                ImGui::TextColored(ImVec4(0,1,1,1), "PROMOTE TO");
                const PieceType choices[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};
                const char* labels[] = {"Queen", "Rook", "Bishop", "Knight"};
                for (int i = 0; i < 4; ++i) {
                    if (i > 0) ImGui::SameLine();
                    if (ImGui::Button(labels[i])) record(game.complete_promotion(choices[i]));
                }
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,1,1), "NEW GAME");
            ImGui::Separator();
            const char* modes[] = {"Two Lines", "One Line", "Three Lines"};
            int mode_idx = std::min(static_cast<int>(mode), 2);
            if (ImGui::Combo("Setup", &mode_idx, modes, 3)) mode = static_cast<SetupMode>(mode_idx);
            ImGui::InputInt("Size", &board_size);
            board_size = std::clamp(board_size, MIN_BOARD_SIZE, MAX_BOARD_SIZE);
            const char* levels[] = {"Easy", "Medium", "Hard"};
            int level_idx = static_cast<int>(difficulty);
            if (ImGui::Combo("AI Level", &level_idx, levels, 3)) difficulty = static_cast<Search::Difficulty>(level_idx);
            const char* sides[] = {"Play White", "Play Black", "Bot vs Bot"};
            ImGui::Combo("Mode", &human_side_int, sides, 3);
            ImGui::Checkbox("Flip Board", &view.flipped);

            // Only allow a reset if the bot isn't busy
            if (!is_thinking) {
                if (ImGui::Button("New Game", ImVec2(100, 30))) {
                    start_game();
                    clear_selection(); checked_king.reset(); history.clear();
                }
            } else {
                ImGui::BeginDisabled();
                ImGui::Button("New (Busy)", ImVec2(100, 30));
                ImGui::EndDisabled();
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,0,1), "FEN");
            ImGui::Separator();
            ImGui::InputText("##fen", fen_buffer, sizeof(fen_buffer));
            if (!is_thinking && ImGui::Button("Import")) {
                ParseResult result = game.fen(fen_buffer);
                fen_status = result.success ? "FEN imported" : result.error;
                if (result.success) {
                    board_size = game.get_board_state().size;
                    clear_selection(); checked_king.reset(); history.clear();
                }
            }
            ImGui::SameLine();
            if (ImGui::Button("Export")) {
                std::string exported = game.fen();
                std::strncpy(fen_buffer, exported.c_str(), sizeof(fen_buffer) - 1);
                ImGui::SetClipboardText(exported.c_str());
                fen_status = "FEN copied to clipboard";
            }
            if (!fen_status.empty()) ImGui::TextWrapped("%s", fen_status.c_str());

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,0,1), "MOVES");
            ImGui::Separator();
            ImGui::BeginChild("history", ImVec2(0, 0));
            for (size_t i = 0; i < history.size(); i += 2) {
                if (i + 1 < history.size()) {
                    ImGui::Text("%zu. %s  %s", i / 2 + 1, history[i].c_str(), history[i + 1].c_str());
                } else {
                    ImGui::Text("%zu. %s", i / 2 + 1, history[i].c_str());
                }
            }
            ImGui::EndChild();

            ImGui::End();

            // BOT LOGIC (NON-BLOCKING)
            bool bot_turn = !human_moves();
            if (game.get_game_state() == GameState::Playing && bot_turn && !is_thinking) {
                if (game.is_awaiting_promotion()) {
                    record(game.complete_promotion(PieceType::Queen));
                } else {
                    bot_future = game.request_best_move(game.get_board_state().to_move, difficulty);
                    is_thinking = true;
                }
            }

            if (is_thinking && bot_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                is_thinking = false;
                std::optional<Move> best = bot_future.get();
                if (best) {
                    MoveOutcome outcome = game.try_make_move(best->from, best->to);
                    if (outcome.success && outcome.promotion_square) outcome = game.complete_promotion(PieceType::Queen);
                    if (outcome.success) record(outcome);
                }
            }

            // RENDER (Runs every frame, regardless of bot status)
            window.clear(sf::Color(30, 30, 30));
            render_board();
            ImGui::SFML::Render(window);
            window.display();
        }

        if (bot_future.valid()) bot_future.wait();
        ImGui::SFML::Shutdown();
    }
}
