/*

test_session_state.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE session_state_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <smtpsink/smtp/types.hpp>

using smtpsink::smtp::session_state;


namespace
{

session_state filled_state()
{
    session_state st;
    st.greeting_verb = "EHLO";
    st.server_name = "mx.example.net";
    st.client_name = "client.example.org";
    st.return_path = "foo@example.net";
    st.recipients = {"u1@example.net", "u2@example.net"};
    st.headers = {"Subject: x"};
    st.body = "hello\r\n";
    return st;
}

} // namespace


BOOST_AUTO_TEST_CASE(new_state_has_not_started)
{
    session_state st;
    BOOST_TEST(!st.has_started());
    BOOST_TEST(st.return_path.empty());
    BOOST_TEST(st.recipients.empty());
    BOOST_TEST(st.headers.empty());
    BOOST_TEST(st.body.empty());
}

BOOST_AUTO_TEST_CASE(greeting_verb_starts_session)
{
    session_state st;
    st.greeting_verb = "HELO";
    BOOST_TEST(st.has_started());
}

BOOST_AUTO_TEST_CASE(reset_keeps_identity_and_drops_envelope)
{
    session_state st = filled_state();
    st.reset();

    BOOST_TEST(st.has_started());
    BOOST_TEST(st.greeting_verb == "EHLO");
    BOOST_TEST(st.server_name == "mx.example.net");
    BOOST_TEST(st.client_name == "client.example.org");
    BOOST_TEST(st.return_path.empty());
    BOOST_TEST(st.recipients.empty());
    BOOST_TEST(st.headers.empty());
    BOOST_TEST(st.body.empty());
}

BOOST_AUTO_TEST_CASE(reset_twice_is_noop)
{
    session_state st = filled_state();
    st.reset();
    const std::string once = smtpsink::smtp::to_string(st);
    st.reset();
    BOOST_TEST(smtpsink::smtp::to_string(st) == once);
    BOOST_TEST(st.client_name == "client.example.org");
}

BOOST_AUTO_TEST_CASE(render_envelope)
{
    const std::string expected =
        "MAIL FROM: <foo@example.net>\r\n"
        "RCPT TO: <u1@example.net>\r\n"
        "RCPT TO: <u2@example.net>\r\n"
        "DATA\r\n"
        "Subject: x\r\n"
        "\r\n"
        "hello\r\n";
    BOOST_TEST(smtpsink::smtp::to_string(filled_state()) == expected);
}

BOOST_AUTO_TEST_CASE(render_several_headers)
{
    session_state st;
    st.return_path = "foo@example.net";
    st.recipients = {"user1@example.net", "user2@example.net"};
    st.headers = {
        "From: Foo<foo@example.net>",
        "To: User1<user1@example.net>",
        "Cc: User2<user2@example.net>",
        "Subject: Reveal SMTP state",
    };
    st.body = "This is a test message.\r\nAre you sure?\r\n";

    const std::string expected =
        "MAIL FROM: <foo@example.net>\r\n"
        "RCPT TO: <user1@example.net>\r\n"
        "RCPT TO: <user2@example.net>\r\n"
        "DATA\r\n"
        "From: Foo<foo@example.net>\r\n"
        "To: User1<user1@example.net>\r\n"
        "Cc: User2<user2@example.net>\r\n"
        "Subject: Reveal SMTP state\r\n"
        "\r\n"
        "This is a test message.\r\n"
        "Are you sure?\r\n";
    BOOST_TEST(smtpsink::smtp::to_string(st) == expected);
}

BOOST_AUTO_TEST_CASE(render_empty_state)
{
    BOOST_TEST(smtpsink::smtp::to_string(session_state{}) == "MAIL FROM: <>\r\nDATA\r\n\r\n");
}

BOOST_AUTO_TEST_CASE(render_keeps_recipient_order_and_duplicates)
{
    session_state st;
    st.return_path = "a@x";
    st.recipients = {"b@x", "a@x", "b@x"};
    BOOST_TEST(smtpsink::smtp::to_string(st) ==
        "MAIL FROM: <a@x>\r\nRCPT TO: <b@x>\r\nRCPT TO: <a@x>\r\nRCPT TO: <b@x>\r\nDATA\r\n\r\n");
}
