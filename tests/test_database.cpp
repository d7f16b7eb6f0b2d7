#include "test_framework.hpp"

#include "berth/database/manager.hpp"

#include <string>

void register_database_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;
  namespace db = berth::database;

  tests.push_back({"database_conninfo_quotes_values", [] {
                     db::PostgresOptions options;
                     options.admin_password = "it's\\secret";
                     options.connect_timeout_secs = 5;
                     require(db::build_conninfo(options) ==
                                 "host='127.0.0.1' port=5432 user='postgres' "
                                 "password='it\\'s\\\\secret' dbname='postgres' "
                                 "connect_timeout=5 application_name='berth'",
                             "quoted conninfo");
                   }});

  tests.push_back({"database_conninfo_omits_empty_password", [] {
                     db::PostgresOptions options;
                     options.host = "db.internal";
                     options.port = 6543;
                     const auto conninfo = db::build_conninfo(options);
                     require(conninfo.find("password") == std::string::npos, "no password key");
                     require(conninfo.find("host='db.internal' port=6543") == 0, "host and port");
                   }});

  tests.push_back({"database_rejects_invalid_service_before_connecting", [] {
                     db::PostgresOptions options;
                     options.port = 1;
                     options.connect_timeout_secs = 1;
                     db::PostgresDatabaseManager manager(options);
                     auto created = manager.create_database("bad name; DROP");
                     require(!created.ok(), "create refused");
                     require(created.error().find("connecting") == std::string::npos,
                             "no connection attempted");
                     auto dropped = manager.drop_database("../etc");
                     require(!dropped.ok(), "drop refused");
                     require(dropped.error().find("connecting") == std::string::npos,
                             "no connection attempted on drop");
                   }});

  tests.push_back({"database_ping_reports_unreachable_server", [] {
                     db::PostgresOptions options;
                     options.port = 1;
                     options.connect_timeout_secs = 1;
                     db::PostgresDatabaseManager manager(options);
                     auto status = manager.ping();
                     require(!status.ok(), "nothing listens on port 1");
                     require(status.error().find("connecting to 127.0.0.1:1") == 0,
                             "names the server");
                   }});
}
