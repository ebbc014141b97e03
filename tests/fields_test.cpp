#include "test_helpers.h"

using namespace TestHelpers;

// ============================================================================
// FIELD SET
// ============================================================================

TEST_CASE("FieldSet: get - Mixed case name -> Finds the value") {
    Ami::FieldSet fields{{"ActionID", "42"}, {"Channel", "PJSIP/100-0001"}};

    REQUIRE(fields.get("actionid") == "42");
    REQUIRE(fields.get("CHANNEL") == "PJSIP/100-0001");
    REQUIRE(fields.action_id() == "42");
}

TEST_CASE("FieldSet: get - Missing name -> Returns nothing") {
    Ami::FieldSet fields{{"Event", "Hangup"}};

    REQUIRE_FALSE(fields.get("Channel").has_value());
    REQUIRE(fields.get_all("Channel").empty());
    REQUIRE_FALSE(fields.contains("Channel"));
    REQUIRE_FALSE(fields.action_id().has_value());
}

TEST_CASE("FieldSet: Repeated name -> get returns first, get_all returns every value in order") {
    Ami::FieldSet fields{
        {"Action", "Originate"},
        {"Variable", "a=1"},
        {"Channel", "Local/100@default"},
        {"variable", "b=2"},
        {"VARIABLE", "c=3"}
    };

    REQUIRE(fields.get("Variable") == "a=1");

    auto values = fields.get_all("variable");
    REQUIRE(values.size() == 3);
    REQUIRE(values[0] == "a=1");
    REQUIRE(values[1] == "b=2");
    REQUIRE(values[2] == "c=3");
}

TEST_CASE("FieldSet: name_of -> Keeps the casing of the first occurrence") {
    Ami::FieldSet fields{{"CallerIDNum", "100"}, {"calleridnum", "200"}};

    REQUIRE(fields.name_of("CALLERIDNUM") == "CallerIDNum");
    REQUIRE_FALSE(fields.name_of("Exten").has_value());
}

TEST_CASE("FieldSet: fields -> Preserves insertion order") {
    Ami::FieldSet fields{{"Z", "1"}, {"A", "2"}, {"M", "3"}};

    REQUIRE(fields.size() == 3);
    REQUIRE(fields.fields()[0].first == "Z");
    REQUIRE(fields.fields()[1].first == "A");
    REQUIRE(fields.fields()[2].first == "M");
}

// ============================================================================
// ACTION
// ============================================================================

TEST_CASE("Action: Construction -> Action field comes first") {
    Ami::Action action("Hangup", {{"Channel", "SIP/200-0002"}});

    REQUIRE(action.name() == "Hangup");
    REQUIRE(action.fields().front().first == "Action");
    REQUIRE(action.get("channel") == "SIP/200-0002");
}

TEST_CASE("Action: serialize -> Writes caller casing, CRLF lines and a blank terminator") {
    Ami::Action action("Ping");
    action.add("actionid", "abc.1");

    REQUIRE(action.serialize() == "Action: Ping\r\nactionid: abc.1\r\n\r\n");
}

TEST_CASE("Action: set_action_id - Existing id -> Replaced in place") {
    Ami::Action action("Status", {{"ActionID", "old"}, {"Channel", "x"}});
    action.set_action_id("new");

    REQUIRE(action.get_all("ActionID").size() == 1);
    REQUIRE(action.action_id() == "new");
    REQUIRE(action.fields()[1].first == "ActionID");
}

TEST_CASE("Action: set_action_id - No id -> Appended") {
    Ami::Action action("Ping");
    action.set_action_id("p.7");

    REQUIRE(action.fields().back() == Ami::Field{"ActionID", "p.7"});
}

TEST_CASE("Action: Invalid input -> Throws invalid_argument") {
    REQUIRE_THROWS_AS(Ami::Action(""), std::invalid_argument);
    REQUIRE_THROWS_AS(Ami::Action("Ping\r\nAction: Logoff"), std::invalid_argument);

    Ami::Action action("Setvar");
    REQUIRE_THROWS_AS(action.add("", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(action.add("Bad:Name", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(action.add("Value", "line\nbreak"), std::invalid_argument);
    REQUIRE_THROWS_AS(action.set_action_id(""), std::invalid_argument);
}

// ============================================================================
// RESPONSE / EVENT / ERROR
// ============================================================================

TEST_CASE("Response: is_error -> Matches Error status in any case") {
    Ami::Response error{{"Response", "error"}, {"Message", "Permission denied"}};
    Ami::Response success{{"Response", "Success"}};
    Ami::Response follows{{"Response", "Follows"}};

    REQUIRE(error.is_error());
    REQUIRE(error.message() == "Permission denied");
    REQUIRE_FALSE(success.is_error());
    REQUIRE_FALSE(follows.is_error());
    REQUIRE(success.status() == "Success");
}

TEST_CASE("Event: name -> Returns the Event field") {
    Ami::Event event{{"Privilege", "call,all"}, {"event", "Newchannel"}};

    REQUIRE(event.name() == "Newchannel");
}

TEST_CASE("ActionError: ProtocolError -> Carries the full response") {
    Ami::Response response{{"Response", "Error"}, {"ActionID", "1"}, {"Message", "No such channel"}};
    Ami::ActionError error(Ami::ErrorKind::ProtocolError, "No such channel", response);

    REQUIRE(error.kind() == Ami::ErrorKind::ProtocolError);
    REQUIRE(std::string(error.what()) == "No such channel");
    REQUIRE(error.response().has_value());
    REQUIRE(error.response()->fields() == response.fields());
}

TEST_CASE("ErrorKind: to_string -> Names every kind") {
    REQUIRE(Ami::to_string(Ami::ErrorKind::ConnectionClosed) == "connection closed");
    REQUIRE(Ami::to_string(Ami::ErrorKind::ConnectionEnding) == "connection ending");
    REQUIRE(Ami::to_string(Ami::ErrorKind::ProtocolError) == "protocol error");
    REQUIRE(Ami::to_string(Ami::ErrorKind::TransportFault) == "transport fault");
    REQUIRE(Ami::to_string(Ami::ErrorKind::DuplicateActionId) == "duplicate ActionID");
}

TEST_CASE("Utils: iequals -> ASCII case-insensitive") {
    REQUIRE(Ami::iequals("ActionID", "actionid"));
    REQUIRE(Ami::iequals("", ""));
    REQUIRE_FALSE(Ami::iequals("Action", "ActionID"));
}
