#include <waybill/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using waybill::schema::event_type_t;
using waybill::schema::integrity_status_t;
using waybill::schema::lifecycle_error_code;
using waybill::schema::lifecycle_state_t;
using waybill::schema::role_id_t;

TEST(engine, create_records_the_created_event) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_create"};
  auto result =
      fixture.engine().create_shipment({{"origin", "Delhi"}, {"weight", "12"}});

  EXPECT_EQ(result.code, lifecycle_error_code::ok);
  EXPECT_EQ(result.shipment_id, "SHP-0000000001");
  EXPECT_EQ(result.event_seq, 1u);
  EXPECT_EQ(result.previous_state, lifecycle_state_t::none);
  EXPECT_EQ(result.new_state, lifecycle_state_t::created);
  EXPECT_EQ(result.codespace, "waybill.create");

  auto projection = fixture.engine().get_shipment(result.shipment_id);
  ASSERT_TRUE(projection.has_value());
  EXPECT_EQ(projection->current_state, lifecycle_state_t::created);
  EXPECT_EQ(projection->current_payload.at("origin"), "Delhi");
  EXPECT_EQ(projection->roles_involved, std::vector{role_id_t::sender});
}

TEST(engine, approval_cannot_be_repeated) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_repeat"};
  auto shipment = fixture.create();

  auto approved = fixture.engine().transition_shipment(
      shipment, event_type_t::manager_approved, role_id_t::sender_manager);
  EXPECT_EQ(approved.code, lifecycle_error_code::ok);
  EXPECT_EQ(approved.previous_state, lifecycle_state_t::created);
  EXPECT_EQ(approved.new_state, lifecycle_state_t::manager_approved);

  auto again = fixture.engine().transition_shipment(
      shipment, event_type_t::manager_approved, role_id_t::sender_manager);
  EXPECT_EQ(again.code, lifecycle_error_code::invalid_transition);
  EXPECT_NE(again.log.find("invalid transition"), std::string::npos);
  EXPECT_EQ(fixture.engine().get_shipment(shipment)->event_count, 2u);
}

TEST(engine, supervisor_approval_requires_the_supervisor) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_authority"};
  auto shipment = fixture.create();
  fixture.advance(shipment, 1);

  for (auto role : {role_id_t::sender, role_id_t::sender_manager,
                    role_id_t::system, role_id_t::customer}) {
    auto result = fixture.engine().transition_shipment(
        shipment, event_type_t::supervisor_approved, role);
    EXPECT_EQ(result.code, lifecycle_error_code::unauthorized);
    EXPECT_NE(result.log.find("unauthorized role"), std::string::npos);
  }
  auto projection = fixture.engine().get_shipment(shipment);
  EXPECT_EQ(projection->current_state, lifecycle_state_t::manager_approved);
  EXPECT_EQ(projection->event_count, 2u);

  EXPECT_EQ(fixture.engine()
                .transition_shipment(shipment,
                                     event_type_t::supervisor_approved,
                                     role_id_t::sender_supervisor)
                .code,
            lifecycle_error_code::ok);
}

TEST(engine, closed_shipment_rejects_everything) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_closed"};
  auto shipment = fixture.create();
  fixture.advance(shipment, waybill::testing::kHappyPath.size());
  ASSERT_EQ(fixture.engine().get_shipment(shipment)->current_state,
            lifecycle_state_t::lifecycle_closed);

  for (const auto& [event_name, event_type] :
       waybill::schema::kEventTypeMappings) {
    for (const auto& [role_name, role] : waybill::schema::kRoleIdMappings) {
      auto result =
          fixture.engine().transition_shipment(shipment, event_type, role);
      EXPECT_EQ(result.code, lifecycle_error_code::invalid_transition)
          << event_name << " by " << role_name;
    }
  }
  auto projection = fixture.engine().get_shipment(shipment);
  EXPECT_EQ(projection->current_state, lifecycle_state_t::lifecycle_closed);
  EXPECT_EQ(projection->event_count, 1u + waybill::testing::kHappyPath.size());
}

TEST(engine, hold_and_retry_cycles_restore_only_state_authority) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_cycles"};
  auto& engine = fixture.engine();
  auto shipment = fixture.create();

  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::manager_on_hold,
                                     role_id_t::sender_manager)
                .code,
            lifecycle_error_code::ok);
  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::manager_approved,
                                     role_id_t::sender_supervisor)
                .code,
            lifecycle_error_code::unauthorized);
  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::hold_released,
                                     role_id_t::sender_manager)
                .code,
            lifecycle_error_code::ok);
  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::manager_on_hold,
                                     role_id_t::sender_manager)
                .code,
            lifecycle_error_code::ok);

  auto approved = engine.transition_shipment(
      shipment, event_type_t::manager_approved, role_id_t::sender_manager);
  EXPECT_EQ(approved.code, lifecycle_error_code::ok);
  EXPECT_EQ(approved.previous_state, lifecycle_state_t::manager_on_hold);
  EXPECT_EQ(approved.new_state, lifecycle_state_t::manager_approved);

  for (std::size_t step = 1; step < 6; ++step) {
    const auto& [event_type, role] = waybill::testing::kHappyPath[step];
    ASSERT_EQ(engine.transition_shipment(shipment, event_type, role).code,
              lifecycle_error_code::ok);
  }
  ASSERT_EQ(engine.get_shipment(shipment)->current_state,
            lifecycle_state_t::out_for_delivery);

  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::delivery_failed,
                                     role_id_t::system)
                .code,
            lifecycle_error_code::ok);
  EXPECT_EQ(engine
                .transition_shipment(shipment,
                                     event_type_t::delivery_confirmed,
                                     role_id_t::customer)
                .code,
            lifecycle_error_code::invalid_transition);
  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::delivery_retry,
                                     role_id_t::system)
                .code,
            lifecycle_error_code::ok);
  EXPECT_EQ(engine
                .transition_shipment(shipment,
                                     event_type_t::delivery_confirmed,
                                     role_id_t::customer)
                .code,
            lifecycle_error_code::ok);
  EXPECT_TRUE(engine.verify_integrity().valid);
}

TEST(engine, racing_transitions_have_exactly_one_winner) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_race"};
  auto& engine = fixture.engine();

  for (auto round = 0; round < 20; ++round) {
    auto shipment = fixture.create();
    auto approve = waybill::schema::transition_result_t{};
    auto hold = waybill::schema::transition_result_t{};

    // Both callers read seq 1; ON_HOLD -> APPROVED is a legal edge, so
    // only the token decides the loser.
    auto approver = std::thread{[&] {
      approve = engine.transition_shipment(
          shipment, event_type_t::manager_approved, role_id_t::sender_manager,
          {}, std::nullopt, 1);
    }};
    auto holder = std::thread{[&] {
      hold = engine.transition_shipment(
          shipment, event_type_t::manager_on_hold, role_id_t::sender_manager,
          {}, std::nullopt, 1);
    }};
    approver.join();
    holder.join();

    ASSERT_NE(approve.accepted(), hold.accepted());
    auto loser = approve.accepted() ? hold : approve;
    EXPECT_EQ(loser.code, lifecycle_error_code::concurrent_conflict);

    auto projection = engine.get_shipment(shipment);
    EXPECT_EQ(projection->event_count, 2u);
    EXPECT_EQ(projection->current_state, approve.accepted()
                                             ? lifecycle_state_t::manager_approved
                                             : lifecycle_state_t::manager_on_hold);
  }
  EXPECT_TRUE(engine.verify_integrity().valid);
}

TEST(engine, concurrent_creates_issue_distinct_increasing_ids) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_creates"};
  auto& engine = fixture.engine();

  constexpr auto kCallers = 64;
  auto ids_mutex = std::mutex{};
  auto ids = std::vector<waybill::schema::shipment_id_t>{};
  auto threads = std::vector<std::thread>{};
  for (auto caller = 0; caller < kCallers; ++caller) {
    threads.emplace_back([&] {
      auto result = engine.create_shipment({});
      auto lock = std::lock_guard{ids_mutex};
      ids.push_back(result.shipment_id);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto unique = std::set(std::begin(ids), std::end(ids));
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kCallers));
  EXPECT_EQ(*unique.begin(), "SHP-0000000001");
  EXPECT_EQ(*unique.rbegin(), "SHP-0000000064");
  EXPECT_EQ(engine.list_shipments().size(), static_cast<std::size_t>(kCallers));
}

TEST(engine, replayed_event_id_is_idempotent) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_replay"};
  auto& engine = fixture.engine();

  auto created = engine.create_shipment({}, "create-1");
  auto created_again = engine.create_shipment({}, "create-1");
  EXPECT_EQ(created.code, lifecycle_error_code::ok);
  EXPECT_EQ(created_again.code, lifecycle_error_code::duplicate_event);
  EXPECT_TRUE(created_again.accepted());
  EXPECT_EQ(created_again.shipment_id, created.shipment_id);
  EXPECT_EQ(engine.list_shipments().size(), 1u);

  auto first = engine.transition_shipment(
      created.shipment_id, event_type_t::manager_approved,
      role_id_t::sender_manager, {{"approver", "ops"}}, "approve-1");
  auto second = engine.transition_shipment(
      created.shipment_id, event_type_t::manager_approved,
      role_id_t::sender_manager, {{"approver", "ops"}}, "approve-1");
  EXPECT_EQ(first.code, lifecycle_error_code::ok);
  EXPECT_EQ(second.code, lifecycle_error_code::duplicate_event);
  EXPECT_EQ(second.event_seq, first.event_seq);
  EXPECT_EQ(engine.get_shipment(created.shipment_id)->event_count, 2u);

  auto other = fixture.create();
  auto misuse = engine.transition_shipment(
      other, event_type_t::manager_approved, role_id_t::sender_manager, {},
      "approve-1");
  EXPECT_EQ(misuse.code, lifecycle_error_code::invalid_event);
}

TEST(engine, stale_expected_sequence_is_a_conflict) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_token"};
  auto& engine = fixture.engine();
  auto shipment = fixture.create();
  auto token = engine.get_shipment(shipment)->last_event_seq;

  EXPECT_EQ(engine
                .transition_shipment(shipment, event_type_t::manager_on_hold,
                                     role_id_t::sender_manager, {},
                                     std::nullopt, token)
                .code,
            lifecycle_error_code::ok);
  auto stale = engine.transition_shipment(
      shipment, event_type_t::hold_released, role_id_t::sender_manager, {},
      std::nullopt, token);
  EXPECT_EQ(stale.code, lifecycle_error_code::concurrent_conflict);
  EXPECT_EQ(engine.get_shipment(shipment)->current_state,
            lifecycle_state_t::manager_on_hold);
}

TEST(engine, unknown_shipment_is_not_found) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_missing"};
  EXPECT_FALSE(fixture.engine().get_shipment("SHP-0000000099").has_value());
  EXPECT_TRUE(fixture.engine().shipment_history("SHP-0000000099").empty());
  EXPECT_EQ(fixture.engine()
                .transition_shipment("SHP-0000000099",
                                     event_type_t::manager_approved,
                                     role_id_t::sender_manager)
                .code,
            lifecycle_error_code::shipment_not_found);
}

TEST(engine, unknown_shipments_allocate_no_lock_slots) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_lock_slots"};
  auto& engine = fixture.engine();
  auto shipment = fixture.create();
  ASSERT_EQ(engine.lock_slot_count(), 1u);

  for (auto i = 0; i < 200; ++i) {
    EXPECT_EQ(engine
                  .transition_shipment("SHP-BOGUS-" + std::to_string(i),
                                       event_type_t::manager_approved,
                                       role_id_t::sender_manager)
                  .code,
              lifecycle_error_code::shipment_not_found);
  }
  EXPECT_EQ(engine.lock_slot_count(), 1u);

  fixture.advance(shipment, 1);
  EXPECT_EQ(engine.lock_slot_count(), 1u);
}

TEST(engine, creation_cannot_reuse_a_transition_event_id) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_reuse_id"};
  auto& engine = fixture.engine();
  auto shipment = fixture.create();
  ASSERT_EQ(engine
                .transition_shipment(shipment, event_type_t::manager_approved,
                                     role_id_t::sender_manager, {},
                                     "approve-7")
                .code,
            lifecycle_error_code::ok);

  auto misuse = engine.create_shipment({}, "approve-7");
  EXPECT_EQ(misuse.code, lifecycle_error_code::invalid_event);
  EXPECT_FALSE(misuse.accepted());
  EXPECT_EQ(engine.list_shipments().size(), 1u);
}

TEST(engine, shared_event_id_across_shipments_has_one_owner) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_shared_id"};
  auto& engine = fixture.engine();

  for (auto round = 0; round < 20; ++round) {
    auto first = fixture.create();
    auto second = fixture.create();
    auto event_id = "approve-" + std::to_string(round);
    auto first_result = waybill::schema::transition_result_t{};
    auto second_result = waybill::schema::transition_result_t{};

    auto first_caller = std::thread{[&] {
      first_result = engine.transition_shipment(
          first, event_type_t::manager_approved, role_id_t::sender_manager,
          {}, event_id);
    }};
    auto second_caller = std::thread{[&] {
      second_result = engine.transition_shipment(
          second, event_type_t::manager_approved, role_id_t::sender_manager,
          {}, event_id);
    }};
    first_caller.join();
    second_caller.join();

    ASSERT_NE(first_result.accepted(), second_result.accepted());
    const auto& winner = first_result.accepted() ? first_result : second_result;
    const auto& loser = first_result.accepted() ? second_result : first_result;
    EXPECT_EQ(winner.code, lifecycle_error_code::ok);
    EXPECT_EQ(loser.code, lifecycle_error_code::invalid_event);
    EXPECT_EQ(engine.get_shipment(loser.shipment_id)->event_count, 1u);
    EXPECT_EQ(engine.event_log().locate(event_id)->shipment_id,
              winner.shipment_id);
  }
}

TEST(engine, shipments_by_state_are_newest_first) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_by_state"};
  auto& engine = fixture.engine();
  auto older = fixture.create();
  auto newer = fixture.create();
  auto moved = fixture.create();
  fixture.advance(moved, 1);
  fixture.clock().advance(1000);
  engine.transition_shipment(older, event_type_t::manager_on_hold,
                             role_id_t::sender_manager);
  fixture.clock().advance(1000);
  engine.transition_shipment(older, event_type_t::hold_released,
                             role_id_t::sender_manager);

  auto created = engine.get_shipments_by_state(lifecycle_state_t::created);
  ASSERT_EQ(created.size(), 2u);
  EXPECT_EQ(created[0].shipment_id, older);
  EXPECT_EQ(created[1].shipment_id, newer);

  auto distribution = engine.state_distribution();
  EXPECT_EQ(distribution[lifecycle_state_t::created], 2u);
  EXPECT_EQ(distribution[lifecycle_state_t::manager_approved], 1u);
}

TEST(engine, state_survives_restart) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_restart"};
  auto shipment = fixture.create({{"origin", "Chennai"}});
  fixture.advance(shipment, 3);
  auto before = fixture.engine().get_shipment(shipment);

  fixture.restart();
  auto after = fixture.engine().get_shipment(shipment);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(*after, *before);
  EXPECT_EQ(fixture.create(), "SHP-0000000002");
  EXPECT_EQ(fixture.engine()
                .transition_shipment(shipment,
                                     event_type_t::receiver_acknowledged,
                                     role_id_t::receiver_manager)
                .event_seq,
            5u);
}

TEST(engine, audit_report_summarises_the_log) {
  auto fixture = waybill::testing::engine_fixture{"waybill_engine_audit"};
  auto& engine = fixture.engine();
  EXPECT_EQ(engine.audit_report().integrity_status, integrity_status_t::empty);

  auto first = fixture.create();
  auto second = fixture.create();
  fixture.advance(first, 2);
  fixture.advance(second, 1);

  auto report = engine.audit_report();
  EXPECT_EQ(report.integrity_status, integrity_status_t::valid);
  EXPECT_EQ(report.total_events, 5u);
  EXPECT_EQ(report.total_shipments, 2u);
  EXPECT_EQ(report.event_type_distribution[event_type_t::shipment_created], 2u);
  EXPECT_EQ(report.event_type_distribution[event_type_t::manager_approved], 2u);
  EXPECT_EQ(report.role_distribution[role_id_t::sender], 2u);
  EXPECT_EQ(
      report.current_state_distribution[lifecycle_state_t::supervisor_approved],
      1u);
  ASSERT_TRUE(report.first_event_time.has_value());
  ASSERT_TRUE(report.last_event_time.has_value());
  EXPECT_LT(*report.first_event_time, *report.last_event_time);

  waybill::testing::append_raw(fixture.events_log(), "not-a-record\n");
  EXPECT_EQ(engine.audit_report().integrity_status,
            integrity_status_t::corrupted);
}

TEST(engine, strict_reads_stop_at_the_first_corrupt_record) {
  auto fixture = waybill::testing::engine_fixture{
      "waybill_engine_strict", waybill::storage::backend_kind_t::append_file,
      true};
  auto shipment = fixture.create();
  waybill::testing::append_raw(fixture.events_log(), "AAAA\n");
  fixture.advance(shipment, 1);

  auto report = fixture.engine().verify_integrity();
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.code, lifecycle_error_code::corrupt_record);
  EXPECT_EQ(report.events_replayed, 1u);
}

TEST(engine, rocksdb_backend_runs_the_same_lifecycle) {
  auto fixture = waybill::testing::engine_fixture{
      "waybill_engine_rocksdb", waybill::storage::backend_kind_t::rocksdb};
  auto shipment = fixture.create({{"origin", "Kolkata"}});
  fixture.advance(shipment, waybill::testing::kHappyPath.size());
  fixture.restart();

  auto projection = fixture.engine().get_shipment(shipment);
  ASSERT_TRUE(projection.has_value());
  EXPECT_EQ(projection->current_state, lifecycle_state_t::lifecycle_closed);
  EXPECT_EQ(fixture.create(), "SHP-0000000002");
  EXPECT_TRUE(fixture.engine().verify_integrity().valid);
}
