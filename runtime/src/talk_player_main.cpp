/**
 * @file talk_player_main.cpp
 * @brief TalkGraph Player - Main Entry Point
 *
 * Usage:
 *   talk_player intro.talk.json                 # Play a script
 *   talk_player --validate intro.talk.json      # Lint and compile only
 *   talk_player --config talkgraph.json --start 10 intro.talk.json
 */

#include "TalkGraph/runtime/talk_player.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
  TalkGraph::runtime::TalkPlayer player;
  return player.exec(argc, argv, std::cin, std::cout, std::cerr);
}
