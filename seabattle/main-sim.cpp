// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "actions.hpp"
#include "eraconfig.hpp"
#include "game.hpp"
#include "gamestatejson.hpp"

#include <seautil/jsonutils.hpp>
#include <seautil/random.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>
#include <google/protobuf/util/json_util.h>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace
{

DEFINE_string (era_config, "",
               "path to the JSON file with the era configuration");
DEFINE_string (seed, "",
               "seed for the random choices; if empty, a secure random"
               " seed is used");

DEFINE_int32 (human_alliance, -1,
              "if non-negative, add a human player reading fire actions"
              " from stdin to this alliance");
DEFINE_string (human_name, "Player", "name of the human player");
DEFINE_int32 (human_timeout_ms, 60'000,
              "time in milliseconds the human player has to choose a target");

DEFINE_int32 (max_actions, 10'000,
              "maximum number of turns to simulate before giving up");
DEFINE_bool (prevent_overlap, true,
             "whether ships of the same fleet may not overlap (overrides"
             " the era config if set explicitly)");

DEFINE_string (stats_json, "",
               "if set, write the match result and statistics as JSON"
               " to this file");

using namespace seabattle;

/**
 * Callbacks that print the event log to stdout and remember the final
 * match result.
 */
class PrintingCallbacks : public Game::Callbacks
{

public:

  bool finished = false;
  proto::MatchResult result;

  void
  StateChanged (const ActionResult& res) override
  {
    std::cout << "[" << res.logEntry.turn << "] " << res.message << std::endl;
  }

  void
  MatchFinished (const proto::MatchResult& r) override
  {
    finished = true;
    result = r;
  }

};

/**
 * Reads fire actions as JSON lines from stdin and supplies them as fire
 * orders to the human player's target request.  When stdin is closed, a
 * pending request is cancelled.
 */
class StdinTargetReader
{

private:

  /** Interval at which the reader checks whether it should stop.  */
  static constexpr int POLL_INTERVAL_MS = 100;

  TargetRequest& request;
  std::atomic<bool> stopped;

  std::thread reader;

  void
  WaitUntilPending ()
  {
    while (!stopped && !request.IsPending ())
      std::this_thread::sleep_for (std::chrono::milliseconds (10));
  }

  void
  ProcessLine (const std::string& line)
  {
    if (line.empty ())
      return;

    Json::Value val;
    proto::Action action;
    if (!seautil::ParseJsonString (line, val) || !ParseAction (val, action)
          || !action.has_fire ())
      {
        std::cerr << "Expected a fire action, e.g. "
                  << R"({"type": "fire", "row": 0, "col": 0})"
                  << std::endl;
        return;
      }

    WaitUntilPending ();
    const FireOrder order = FireOrderFromProto (action.fire ());
    if (!stopped && !request.Supply (order))
      LOG (WARNING) << "No target request pending for " << order.target;
  }

  /**
   * Reads stdin until it is closed or the reader is stopped.  stdin is
   * polled with a timeout, so that the thread never blocks for longer
   * than POLL_INTERVAL_MS and can always be joined.
   */
  void
  Run ()
  {
    std::string buffer;
    while (!stopped)
      {
        pollfd fd;
        fd.fd = STDIN_FILENO;
        fd.events = POLLIN;
        fd.revents = 0;

        const int rc = poll (&fd, 1, POLL_INTERVAL_MS);
        if (rc < 0)
          {
            if (errno == EINTR)
              continue;
            PLOG (ERROR) << "Failed to poll stdin";
            break;
          }
        if (rc == 0)
          continue;

        char data[4'096];
        const ssize_t n = read (STDIN_FILENO, data, sizeof (data));
        if (n < 0)
          {
            if (errno == EINTR || errno == EAGAIN)
              continue;
            PLOG (ERROR) << "Failed to read stdin";
            break;
          }
        if (n == 0)
          break;

        buffer.append (data, n);
        size_t pos;
        while (!stopped && (pos = buffer.find ('\n')) != std::string::npos)
          {
            ProcessLine (buffer.substr (0, pos));
            buffer.erase (0, pos + 1);
          }
      }

    if (!stopped && !buffer.empty ())
      ProcessLine (buffer);

    stopped = true;
    request.Cancel ();
  }

public:

  explicit StdinTargetReader (TargetRequest& r)
    : request(r), stopped(false)
  {
    reader = std::thread ([this] () { Run (); });
  }

  ~StdinTargetReader ()
  {
    stopped = true;
    reader.join ();
  }

  StdinTargetReader (const StdinTargetReader&) = delete;
  void operator= (const StdinTargetReader&) = delete;

  bool
  IsStopped () const
  {
    return stopped;
  }

};

bool
ReadFile (const std::string& path, std::string& out)
{
  std::ifstream in(path);
  if (!in)
    {
      LOG (ERROR) << "Could not open " << path;
      return false;
    }

  std::ostringstream data;
  data << in.rdbuf ();
  out = data.str ();

  return true;
}

/**
 * Adds a default AI captain to every alliance that has no players yet.
 */
void
AddMissingCaptains (const proto::EraConfig& cfg, Game& game)
{
  for (const auto& a : game.GetAlliances ())
    {
      if (!a->IsEmpty ())
        continue;

      proto::AiCaptain captain;
      captain.set_name ("Captain of " + a->GetName ());

      PlayerId id;
      CHECK (game.AddAi (captain, a->GetId (), id));
    }
}

bool
WriteStats (const std::string& path, const GameStateJson& gsj,
            const proto::MatchResult& result)
{
  std::string resultStr;
  const auto status
      = google::protobuf::util::MessageToJsonString (result, &resultStr);
  if (!status.ok ())
    {
      LOG (ERROR) << "Failed to convert match result: " << status.ToString ();
      return false;
    }

  Json::Value out(Json::objectValue);
  CHECK (seautil::ParseJsonString (resultStr, out["result"]));
  out["stats"] = gsj.GetGameStats ();

  std::ofstream file(path);
  file << seautil::JsonToCompactString (out) << std::endl;
  if (!file)
    {
      LOG (ERROR) << "Failed to write " << path;
      return false;
    }

  return true;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Simulate a seabattle match");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_era_config.empty ())
    {
      std::cerr << "Error: --era_config must be set" << std::endl;
      return EXIT_FAILURE;
    }

  std::string eraJson;
  proto::EraConfig cfg;
  if (!ReadFile (FLAGS_era_config, eraJson)
        || !LoadEraConfigFromJson (eraJson, cfg))
    {
      std::cerr << "Error: invalid era config " << FLAGS_era_config
                << std::endl;
      return EXIT_FAILURE;
    }
  if (!gflags::GetCommandLineFlagInfoOrDie ("prevent_overlap").is_default)
    cfg.mutable_rules ()->set_prevent_fleet_overlap (FLAGS_prevent_overlap);

  seautil::Random rnd;
  if (FLAGS_seed.empty ())
    rnd.SeedSecurely ();
  else
    rnd.SeedFromString (FLAGS_seed);

  Game game(cfg);
  PrintingCallbacks cb;
  game.RegisterCallback (cb);

  PlayerId human;
  const bool hasHuman = (FLAGS_human_alliance >= 0);
  if (hasHuman
        && !game.AddHuman (FLAGS_human_name, FLAGS_human_alliance, human))
    {
      std::cerr << "Error: cannot add human player to alliance "
                << FLAGS_human_alliance << std::endl;
      return EXIT_FAILURE;
    }
  if (hasHuman)
    LOG (INFO)
        << "Playing against "
        << game.GetAlliances ()[OpposingAlliance (cfg, FLAGS_human_alliance)]
              ->GetName ();

  LOG (INFO) << "Added " << game.AddConfiguredAi () << " AI captains";
  AddMissingCaptains (cfg, game);

  auto res = game.StartPlacement ();
  if (res.IsOk () && hasHuman)
    res = game.AutoPlace (human, rnd);
  if (res.IsOk ())
    res = game.AutoPlaceAi (rnd);
  if (res.IsOk ())
    res = game.StartBattle (rnd.NextInt (game.GetPlayers ().size ()));
  if (!res.IsOk ())
    {
      std::cerr << "Error: could not set up the match: " << res.message
                << std::endl;
      return EXIT_FAILURE;
    }

  std::unique_ptr<StdinTargetReader> stdinReader;
  if (hasHuman)
    {
      auto& p = dynamic_cast<HumanPlayer&> (*game.GetPlayer (human));
      stdinReader = std::make_unique<StdinTargetReader> (
          p.GetTargetRequest ());
    }

  const std::chrono::milliseconds humanTimeout(FLAGS_human_timeout_ms);
  for (int i = 0; i < FLAGS_max_actions; ++i)
    {
      const Player* cur = game.GetCurrentPlayer ();
      if (cur == nullptr)
        break;

      bool stop = false;
      switch (cur->GetType ())
        {
        case PlayerType::AI:
          res = game.AdvanceAi (rnd);
          stop = (res.status == Status::RESOURCE_EXHAUSTED);
          break;

        case PlayerType::HUMAN:
          if (stdinReader == nullptr || stdinReader->IsStopped ())
            {
              LOG (WARNING) << "No more input for " << cur->GetName ();
              stop = true;
              break;
            }
          std::cout << cur->GetName () << ", choose your target:"
                    << std::endl;
          res = game.AdvanceHuman (humanTimeout);
          break;
        }

      if (stop || res.status == Status::CANCELLED)
        break;
      if (!res.IsOk ())
        std::cout << "Rejected: " << res.message << std::endl;
    }

  /* The reader thread refers to the human's target request, so it has
     to be joined before the game goes away.  */
  stdinReader.reset ();

  GameStateJson gsj(game);
  if (!cb.finished)
    {
      std::cout << "The match did not finish" << std::endl;
      cb.result = BuildMatchResult (game);
    }
  std::cout << seautil::JsonToCompactString (gsj.GetGameStats ())
            << std::endl;

  int exitCode = EXIT_SUCCESS;
  if (!FLAGS_stats_json.empty ()
        && !WriteStats (FLAGS_stats_json, gsj, cb.result))
    exitCode = EXIT_FAILURE;

  game.UnregisterCallback (cb);
  google::protobuf::ShutdownProtobufLibrary ();
  return exitCode;
}
