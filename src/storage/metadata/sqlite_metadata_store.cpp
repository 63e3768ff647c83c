#include "storage/metadata/sqlite_metadata_store.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "storage/database_error.hpp"
#include "storage/metadata/json_columns.hpp"
#include "storage/metadata/sqlite_util.hpp"

namespace calcflow::storage
{
    using primitives::CalcJob;
    using primitives::Client;
    using primitives::Code;
    using primitives::Processing;

    namespace
    {
        constexpr int kSchemaVersion = 1;

        constexpr const char *kSchema = R"sql(
CREATE TABLE IF NOT EXISTS client (
    pk                 INTEGER PRIMARY KEY AUTOINCREMENT,
    label              TEXT    NOT NULL UNIQUE CHECK (length(label) > 0),
    client_url         TEXT    NOT NULL,
    client_id          TEXT    NOT NULL,
    client_secret      TEXT    NOT NULL,
    token_uri          TEXT    NOT NULL,
    machine_name       TEXT    NOT NULL,
    work_dir           TEXT    NOT NULL,
    small_file_size_mb INTEGER NOT NULL DEFAULT 5 CHECK (small_file_size_mb >= 0)
);

CREATE TABLE IF NOT EXISTS code (
    pk           INTEGER PRIMARY KEY AUTOINCREMENT,
    label        TEXT    NOT NULL UNIQUE CHECK (length(label) > 0),
    client_pk    INTEGER NOT NULL REFERENCES client (pk) ON DELETE RESTRICT,
    script       TEXT    NOT NULL,
    upload_paths TEXT    NOT NULL DEFAULT '{}'
);

CREATE TABLE IF NOT EXISTS calcjob (
    pk             INTEGER PRIMARY KEY AUTOINCREMENT,
    label          TEXT    NOT NULL,
    uuid           TEXT    NOT NULL UNIQUE CHECK (length(uuid) > 0),
    code_pk        INTEGER NOT NULL REFERENCES code (pk) ON DELETE RESTRICT,
    parameters     TEXT    NOT NULL DEFAULT '{}',
    upload_paths   TEXT    NOT NULL DEFAULT '{}',
    download_globs TEXT    NOT NULL DEFAULT '[]',
    UNIQUE (code_pk, label)
);

CREATE TABLE IF NOT EXISTS step_order (
    step TEXT    PRIMARY KEY,
    ord  INTEGER NOT NULL UNIQUE
);

INSERT OR IGNORE INTO step_order (step, ord) VALUES
    ('created', 0), ('uploading', 1), ('submitting', 2), ('submitted', 3), ('polling', 4),
    ('downloading', 5), ('parsing', 6), ('finished', 7), ('excepted', 8);

CREATE TABLE IF NOT EXISTS processing (
    pk              INTEGER PRIMARY KEY AUTOINCREMENT,
    calcjob_pk      INTEGER NOT NULL UNIQUE REFERENCES calcjob (pk) ON DELETE RESTRICT,
    step            TEXT    NOT NULL DEFAULT 'created' REFERENCES step_order (step),
    state           TEXT    NOT NULL DEFAULT 'playing',
    job_id          TEXT,
    exception       TEXT,
    retrieved_paths TEXT    NOT NULL DEFAULT '{}',
    remote_state    TEXT    CHECK (remote_state IS NULL
                                   OR remote_state IN ('running', 'completed', 'failed', 'cancelled')),
    failed_step     TEXT    REFERENCES step_order (step),
    claim_owner     TEXT,
    claim_expires   INTEGER,
    CHECK (state = CASE step WHEN 'finished' THEN 'finished'
                             WHEN 'excepted' THEN 'excepted'
                             ELSE 'playing' END),
    CHECK (failed_step IS NULL OR step = 'excepted')
);

CREATE INDEX IF NOT EXISTS processing_state_idx ON processing (state);

CREATE TRIGGER IF NOT EXISTS client_immutable BEFORE UPDATE ON client
BEGIN
    SELECT RAISE(ABORT, 'client rows are immutable');
END;

CREATE TRIGGER IF NOT EXISTS code_immutable BEFORE UPDATE ON code
BEGIN
    SELECT RAISE(ABORT, 'code rows are immutable');
END;

CREATE TRIGGER IF NOT EXISTS calcjob_immutable BEFORE UPDATE ON calcjob
BEGIN
    SELECT RAISE(ABORT, 'calcjob rows are immutable');
END;

CREATE TRIGGER IF NOT EXISTS processing_undeletable BEFORE DELETE ON processing
BEGIN
    SELECT RAISE(ABORT, 'processing rows are never deleted');
END;

CREATE TRIGGER IF NOT EXISTS processing_terminal BEFORE UPDATE ON processing
WHEN OLD.state <> 'playing'
BEGIN
    SELECT RAISE(ABORT, 'processing row is terminal');
END;

CREATE TRIGGER IF NOT EXISTS processing_forward BEFORE UPDATE OF step ON processing
WHEN NEW.step <> OLD.step AND NEW.step <> 'excepted'
     AND (SELECT ord FROM step_order WHERE step = NEW.step)
         <> (SELECT ord FROM step_order WHERE step = OLD.step) + 1
BEGIN
    SELECT RAISE(ABORT, 'processing step must advance one step at a time');
END;

CREATE TRIGGER IF NOT EXISTS processing_job_id_once BEFORE UPDATE OF job_id ON processing
WHEN OLD.job_id IS NOT NULL AND (NEW.job_id IS NULL OR NEW.job_id <> OLD.job_id)
BEGIN
    SELECT RAISE(ABORT, 'remote job id is assigned once');
END;

CREATE VIEW IF NOT EXISTS calcjob_state AS
    SELECT c.pk AS calcjob_pk,
           c.label AS label,
           p.step AS step,
           CASE p.step WHEN 'finished' THEN 'finished'
                       WHEN 'excepted' THEN 'excepted'
                       ELSE 'playing' END AS state
    FROM calcjob c
    JOIN processing p ON p.calcjob_pk = c.pk;
)sql";

        constexpr const char *kClientColumns =
            "pk, label, client_url, client_id, client_secret, token_uri, machine_name, work_dir, small_file_size_mb";

        constexpr const char *kCodeColumns = "pk, label, client_pk, script, upload_paths";

        constexpr const char *kCalcJobColumns =
            "c.pk, c.label, c.uuid, c.code_pk, c.parameters, c.upload_paths, c.download_globs";

        constexpr const char *kProcessingColumns =
            "p.pk, p.calcjob_pk, p.step, p.job_id, p.exception, p.retrieved_paths, p.remote_state, p.failed_step";

        int64_t nowMillis()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch() )
                .count();
        }

        Client readClient( const Statement &stmt )
        {
            Client client;
            client.pk                 = stmt.columnInt( 0 );
            client.label              = stmt.columnText( 1 );
            client.client_url         = stmt.columnText( 2 );
            client.client_id          = stmt.columnText( 3 );
            client.client_secret      = stmt.columnText( 4 );
            client.token_uri          = stmt.columnText( 5 );
            client.machine_name       = stmt.columnText( 6 );
            client.work_dir           = stmt.columnText( 7 );
            client.small_file_size_mb = stmt.columnInt( 8 );
            return client;
        }

        outcome::result<Code> readCode( const Statement &stmt )
        {
            Code code;
            code.pk        = stmt.columnInt( 0 );
            code.label     = stmt.columnText( 1 );
            code.client_pk = stmt.columnInt( 2 );
            code.script    = stmt.columnText( 3 );
            auto uploads   = json_columns::decodePathMap( stmt.columnText( 4 ) );
            if ( !uploads )
            {
                return outcome::failure( uploads.error() );
            }
            code.upload_paths = std::move( uploads.value() );
            return code;
        }

        outcome::result<CalcJob> readCalcJob( const Statement &stmt, int first )
        {
            CalcJob calcjob;
            calcjob.pk      = stmt.columnInt( first );
            calcjob.label   = stmt.columnText( first + 1 );
            calcjob.uuid    = stmt.columnText( first + 2 );
            calcjob.code_pk = stmt.columnInt( first + 3 );

            auto parameters = json_columns::decodeParameters( stmt.columnText( first + 4 ) );
            auto uploads    = json_columns::decodePathMap( stmt.columnText( first + 5 ) );
            auto globs      = json_columns::decodeStringList( stmt.columnText( first + 6 ) );
            if ( !parameters || !uploads || !globs )
            {
                return DatabaseError::CORRUPTION;
            }
            calcjob.parameters     = std::move( parameters.value() );
            calcjob.upload_paths   = std::move( uploads.value() );
            calcjob.download_globs = std::move( globs.value() );
            return calcjob;
        }

        outcome::result<Processing> readProcessing( const Statement &stmt, int first )
        {
            Processing processing;
            processing.pk         = stmt.columnInt( first );
            processing.calcjob_pk = stmt.columnInt( first + 1 );

            auto step = primitives::stepFromString( stmt.columnText( first + 2 ) );
            if ( !step )
            {
                return DatabaseError::CORRUPTION;
            }
            processing.step      = *step;
            processing.job_id    = stmt.columnOptText( first + 3 );
            processing.exception = stmt.columnOptText( first + 4 );

            auto retrieved = json_columns::decodePathMap( stmt.columnText( first + 5 ) );
            if ( !retrieved )
            {
                return outcome::failure( retrieved.error() );
            }
            processing.retrieved_paths = std::move( retrieved.value() );

            if ( auto remote = stmt.columnOptText( first + 6 ) )
            {
                processing.remote_state = primitives::remoteStatusFromString( *remote );
                if ( !processing.remote_state )
                {
                    return DatabaseError::CORRUPTION;
                }
            }
            if ( auto failed = stmt.columnOptText( first + 7 ) )
            {
                processing.failed_step = primitives::stepFromString( *failed );
                if ( !processing.failed_step )
                {
                    return DatabaseError::CORRUPTION;
                }
            }
            return processing;
        }

        const char *columnOf( CalcJobField field )
        {
            switch ( field )
            {
                case CalcJobField::kPk:
                    return "c.pk";
                case CalcJobField::kLabel:
                    return "c.label";
                case CalcJobField::kUuid:
                    return "c.uuid";
                case CalcJobField::kCodePk:
                    return "c.code_pk";
                case CalcJobField::kCodeLabel:
                    return "co.label";
                case CalcJobField::kClientPk:
                    return "co.client_pk";
                case CalcJobField::kClientLabel:
                    return "cl.label";
                case CalcJobField::kState:
                    return "p.state";
                case CalcJobField::kStep:
                    return "p.step";
                case CalcJobField::kJobId:
                    return "p.job_id";
                case CalcJobField::kException:
                    return "p.exception";
            }
            return "c.pk";
        }

        const char *operatorOf( Comparison op )
        {
            switch ( op )
            {
                case Comparison::kEq:
                    return " = ?";
                case Comparison::kNe:
                    return " <> ?";
                case Comparison::kLt:
                    return " < ?";
                case Comparison::kLe:
                    return " <= ?";
                case Comparison::kGt:
                    return " > ?";
                case Comparison::kGe:
                    return " >= ?";
                case Comparison::kLike:
                    return " LIKE ?";
                case Comparison::kIsNull:
                    return " IS NULL";
                case Comparison::kIsNotNull:
                    return " IS NOT NULL";
            }
            return " = ?";
        }

        bool takesValue( Comparison op )
        {
            return op != Comparison::kIsNull && op != Comparison::kIsNotNull;
        }

        /// FROM and WHERE clauses of a calcjob query, values are bound in order
        std::string fromWhere( const CalcJobQuery &query )
        {
            std::string sql = " FROM calcjob c"
                              " JOIN processing p ON p.calcjob_pk = c.pk"
                              " JOIN code co ON co.pk = c.code_pk"
                              " JOIN client cl ON cl.pk = co.client_pk"
                              " JOIN step_order so ON so.step = p.step";
            for ( size_t i = 0; i < query.where.size(); ++i )
            {
                sql += ( i == 0 ) ? " WHERE " : " AND ";
                sql += columnOf( query.where[i].field );
                sql += operatorOf( query.where[i].op );
            }
            return sql;
        }

        int bindPredicates( Statement &stmt, const CalcJobQuery &query )
        {
            int index = 1;
            for ( const auto &predicate : query.where )
            {
                if ( takesValue( predicate.op ) )
                {
                    stmt.bind( index++, predicate.value );
                }
            }
            return index;
        }
    } // namespace

    CalcJobQuery CalcJobQuery::playing( std::optional<size_t> limit )
    {
        CalcJobQuery query;
        query.where.push_back( { CalcJobField::kState, Comparison::kEq, "playing" } );
        query.limit = limit;
        return query;
    }

    outcome::result<std::shared_ptr<SqliteMetadataStore>> SqliteMetadataStore::create( const std::string &path )
    {
        sqlite3 *raw = nullptr;
        int      rc  = sqlite3_open_v2( path.c_str(),
                                  &raw,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                  nullptr );
        Connection db( raw, &sqlite3_close_v2 );
        if ( rc != SQLITE_OK )
        {
            return error_as_result<std::shared_ptr<SqliteMetadataStore>>( rc );
        }
        sqlite3_extended_result_codes( db.get(), 1 );
        sqlite3_busy_timeout( db.get(), 10000 );

        auto store  = std::make_shared<SqliteMetadataStore>( std::move( db ) );
        auto schema = store->initSchema();
        if ( !schema )
        {
            return outcome::failure( schema.error() );
        }
        return store;
    }

    SqliteMetadataStore::SqliteMetadataStore( Connection db ) :
        db_( std::move( db ) ), logger_( base::createLogger( "MetadataStore" ) )
    {
    }

    SqliteMetadataStore::~SqliteMetadataStore() = default;

    outcome::result<void> SqliteMetadataStore::execute( const std::string &sql ) const
    {
        char *message = nullptr;
        int   rc      = sqlite3_exec( db_.get(), sql.c_str(), nullptr, nullptr, &message );
        if ( rc != SQLITE_OK )
        {
            logger_->error( "sqlite: {}", message != nullptr ? message : sqlite3_errstr( rc ) );
            sqlite3_free( message );
            return error_from_sqlite( rc );
        }
        return outcome::success();
    }

    outcome::result<void> SqliteMetadataStore::initSchema()
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        // in-memory databases silently keep their own journal mode
        for ( const char *pragma : { "PRAGMA journal_mode = WAL;",
                                     "PRAGMA synchronous = FULL;",
                                     "PRAGMA foreign_keys = ON;" } )
        {
            auto res = execute( pragma );
            if ( !res )
            {
                return res;
            }
        }
        return transaction(
            [this]() -> outcome::result<void>
            {
                auto created = execute( kSchema );
                if ( !created )
                {
                    return created;
                }
                return execute( "PRAGMA user_version = " + std::to_string( kSchemaVersion ) + ";" );
            } );
    }

    outcome::result<void> SqliteMetadataStore::transaction( const std::function<outcome::result<void>()> &body )
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        const std::string savepoint = "sp_" + std::to_string( transaction_depth_ );

        auto begun = execute( transaction_depth_ == 0 ? "BEGIN IMMEDIATE;" : "SAVEPOINT " + savepoint + ";" );
        if ( !begun )
        {
            return begun;
        }
        ++transaction_depth_;
        auto result = body();
        --transaction_depth_;

        if ( result )
        {
            auto committed = execute( transaction_depth_ == 0 ? "COMMIT;" : "RELEASE " + savepoint + ";" );
            if ( committed )
            {
                return outcome::success();
            }
            result = committed;
        }

        if ( transaction_depth_ == 0 )
        {
            auto rolled_back = execute( "ROLLBACK;" );
            if ( !rolled_back )
            {
                logger_->error( "Rollback failed: {}", rolled_back.error().message() );
            }
        }
        else
        {
            auto rolled_back = execute( "ROLLBACK TO " + savepoint + "; RELEASE " + savepoint + ";" );
            if ( !rolled_back )
            {
                logger_->error( "Rollback to {} failed: {}", savepoint, rolled_back.error().message() );
            }
        }
        return result;
    }

    outcome::result<int64_t> SqliteMetadataStore::insertClient( const Client &client )
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(),
                        "INSERT INTO client (label, client_url, client_id, client_secret, token_uri, "
                        "machine_name, work_dir, small_file_size_mb) VALUES (?, ?, ?, ?, ?, ?, ?, ?)" );
        stmt.bind( 1, client.label )
            .bind( 2, client.client_url )
            .bind( 3, client.client_id )
            .bind( 4, client.client_secret )
            .bind( 5, client.token_uri )
            .bind( 6, client.machine_name )
            .bind( 7, client.work_dir )
            .bind( 8, client.small_file_size_mb );
        int rc = stmt.step();
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<int64_t>( rc, db_.get(), logger_ );
        }
        return sqlite3_last_insert_rowid( db_.get() );
    }

    outcome::result<int64_t> SqliteMetadataStore::insertCode( const Code &code )
    {
        for ( const auto &[path, key] : code.upload_paths )
        {
            if ( !primitives::isValidRelativePath( path ) )
            {
                return DatabaseError::INVALID_ARGUMENT;
            }
        }

        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), "INSERT INTO code (label, client_pk, script, upload_paths) VALUES (?, ?, ?, ?)" );
        stmt.bind( 1, code.label )
            .bind( 2, code.client_pk )
            .bind( 3, code.script )
            .bind( 4, json_columns::encodePathMap( code.upload_paths ) );
        int rc = stmt.step();
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<int64_t>( rc, db_.get(), logger_ );
        }
        return sqlite3_last_insert_rowid( db_.get() );
    }

    outcome::result<int64_t> SqliteMetadataStore::insertCalcJob( const CalcJob &calcjob )
    {
        for ( const auto &[path, key] : calcjob.upload_paths )
        {
            if ( !primitives::isValidRelativePath( path ) )
            {
                return DatabaseError::INVALID_ARGUMENT;
            }
        }
        if ( calcjob.uuid.find( '/' ) != std::string::npos )
        {
            return DatabaseError::INVALID_ARGUMENT;
        }

        std::string uuid = calcjob.uuid;
        if ( uuid.empty() )
        {
            uuid = boost::uuids::to_string( boost::uuids::random_generator()() );
        }
        // unlabelled calcjobs are labelled by their uuid, labels being unique per code
        std::string label = calcjob.label.empty() ? uuid : calcjob.label;

        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        int64_t                               pk = 0;
        auto                                  inserted = transaction(
            [&]() -> outcome::result<void>
            {
                Statement stmt( db_.get(),
                                "INSERT INTO calcjob (label, uuid, code_pk, parameters, upload_paths, download_globs) "
                                "VALUES (?, ?, ?, ?, ?, ?)" );
                stmt.bind( 1, label )
                    .bind( 2, uuid )
                    .bind( 3, calcjob.code_pk )
                    .bind( 4, json_columns::encodeParameters( calcjob.parameters ) )
                    .bind( 5, json_columns::encodePathMap( calcjob.upload_paths ) )
                    .bind( 6, json_columns::encodeStringList( calcjob.download_globs ) );
                int rc = stmt.step();
                if ( rc != SQLITE_DONE )
                {
                    return error_as_result<void>( rc, db_.get(), logger_ );
                }
                pk = sqlite3_last_insert_rowid( db_.get() );

                Statement processing( db_.get(), "INSERT INTO processing (calcjob_pk) VALUES (?)" );
                processing.bind( 1, pk );
                rc = processing.step();
                if ( rc != SQLITE_DONE )
                {
                    return error_as_result<void>( rc, db_.get(), logger_ );
                }
                return outcome::success();
            } );
        if ( !inserted )
        {
            return outcome::failure( inserted.error() );
        }
        return pk;
    }

    outcome::result<Client> SqliteMetadataStore::getClient( int64_t pk ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kClientColumns + " FROM client WHERE pk = ?" );
        stmt.bind( 1, pk );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return readClient( stmt );
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<Client>( rc, db_.get(), logger_ );
    }

    outcome::result<Client> SqliteMetadataStore::getClientByLabel( const std::string &label ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kClientColumns + " FROM client WHERE label = ?" );
        stmt.bind( 1, label );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return readClient( stmt );
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<Client>( rc, db_.get(), logger_ );
    }

    outcome::result<Code> SqliteMetadataStore::getCode( int64_t pk ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kCodeColumns + " FROM code WHERE pk = ?" );
        stmt.bind( 1, pk );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return readCode( stmt );
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<Code>( rc, db_.get(), logger_ );
    }

    outcome::result<Code> SqliteMetadataStore::getCodeByLabel( const std::string &label ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kCodeColumns + " FROM code WHERE label = ?" );
        stmt.bind( 1, label );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return readCode( stmt );
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<Code>( rc, db_.get(), logger_ );
    }

    outcome::result<CalcJob> SqliteMetadataStore::getCalcJob( int64_t pk ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kCalcJobColumns + " FROM calcjob c WHERE c.pk = ?" );
        stmt.bind( 1, pk );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return readCalcJob( stmt, 0 );
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<CalcJob>( rc, db_.get(), logger_ );
    }

    outcome::result<Processing> SqliteMetadataStore::getProcessing( int64_t calcjob_pk ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(),
                        std::string( "SELECT " ) + kProcessingColumns + " FROM processing p WHERE p.calcjob_pk = ?" );
        stmt.bind( 1, calcjob_pk );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return readProcessing( stmt, 0 );
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<Processing>( rc, db_.get(), logger_ );
    }

    outcome::result<std::vector<Client>> SqliteMetadataStore::listClients() const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kClientColumns + " FROM client ORDER BY pk" );
        std::vector<Client> clients;
        int                 rc = SQLITE_OK;
        while ( ( rc = stmt.step() ) == SQLITE_ROW )
        {
            clients.push_back( readClient( stmt ) );
        }
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<std::vector<Client>>( rc, db_.get(), logger_ );
        }
        return clients;
    }

    outcome::result<std::vector<Code>> SqliteMetadataStore::listCodes() const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), std::string( "SELECT " ) + kCodeColumns + " FROM code ORDER BY pk" );
        std::vector<Code> codes;
        int               rc = SQLITE_OK;
        while ( ( rc = stmt.step() ) == SQLITE_ROW )
        {
            auto code = readCode( stmt );
            if ( !code )
            {
                return outcome::failure( code.error() );
            }
            codes.push_back( std::move( code.value() ) );
        }
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<std::vector<Code>>( rc, db_.get(), logger_ );
        }
        return codes;
    }

    outcome::result<std::vector<CalcJobRow>> SqliteMetadataStore::queryCalcJobs( const CalcJobQuery &query ) const
    {
        std::string sql = std::string( "SELECT " ) + kCalcJobColumns + ", " + kProcessingColumns + fromWhere( query );
        sql += " ORDER BY ";
        sql += query.order_by == CalcJobField::kStep ? "so.ord" : columnOf( query.order_by );
        sql += query.descending ? " DESC" : " ASC";
        if ( query.order_by != CalcJobField::kPk )
        {
            sql += ", c.pk";
        }
        sql += " LIMIT ? OFFSET ?";

        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement                             stmt( db_.get(), sql );
        int                                   index = bindPredicates( stmt, query );
        stmt.bind( index, query.limit ? static_cast<int64_t>( *query.limit ) : int64_t{ -1 } );
        stmt.bind( index + 1, static_cast<int64_t>( query.offset ) );

        std::vector<CalcJobRow> rows;
        int                     rc = SQLITE_OK;
        while ( ( rc = stmt.step() ) == SQLITE_ROW )
        {
            auto calcjob    = readCalcJob( stmt, 0 );
            auto processing = readProcessing( stmt, 7 );
            if ( !calcjob || !processing )
            {
                return DatabaseError::CORRUPTION;
            }
            rows.push_back( { std::move( calcjob.value() ), std::move( processing.value() ) } );
        }
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<std::vector<CalcJobRow>>( rc, db_.get(), logger_ );
        }
        return rows;
    }

    outcome::result<size_t> SqliteMetadataStore::countCalcJobs( const CalcJobQuery &query ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement                             stmt( db_.get(), "SELECT COUNT(*)" + fromWhere( query ) );
        bindPredicates( stmt, query );
        int rc = stmt.step();
        if ( rc != SQLITE_ROW )
        {
            return error_as_result<size_t>( rc, db_.get(), logger_ );
        }
        return static_cast<size_t>( stmt.columnInt( 0 ) );
    }

    outcome::result<void> SqliteMetadataStore::ensureProcessingExists( int64_t calcjob_pk ) const
    {
        Statement stmt( db_.get(), "SELECT 1 FROM processing WHERE calcjob_pk = ?" );
        stmt.bind( 1, calcjob_pk );
        int rc = stmt.step();
        if ( rc == SQLITE_ROW )
        {
            return outcome::success();
        }
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        return error_as_result<void>( rc, db_.get(), logger_ );
    }

    outcome::result<void> SqliteMetadataStore::claimCalcJob( int64_t calcjob_pk, const std::string &owner, Lease lease )
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        const auto                            now = nowMillis();
        Statement stmt( db_.get(),
                        "UPDATE processing SET claim_owner = ?1, claim_expires = ?2 "
                        "WHERE calcjob_pk = ?3 AND state = 'playing' "
                        "AND (claim_owner IS NULL OR claim_owner = ?1 OR claim_expires < ?4)" );
        stmt.bind( 1, owner ).bind( 2, now + lease.count() ).bind( 3, calcjob_pk ).bind( 4, now );
        int rc = stmt.step();
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<void>( rc, db_.get(), logger_ );
        }
        if ( sqlite3_changes( db_.get() ) == 1 )
        {
            return outcome::success();
        }
        auto exists = ensureProcessingExists( calcjob_pk );
        if ( !exists )
        {
            return exists;
        }
        return DatabaseError::CONCURRENCY_VIOLATION;
    }

    outcome::result<void> SqliteMetadataStore::renewClaim( int64_t calcjob_pk, const std::string &owner, Lease lease )
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement                             stmt( db_.get(),
                        "UPDATE processing SET claim_expires = ? "
                        "WHERE calcjob_pk = ? AND claim_owner = ? AND state = 'playing'" );
        stmt.bind( 1, nowMillis() + lease.count() ).bind( 2, calcjob_pk ).bind( 3, owner );
        int rc = stmt.step();
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<void>( rc, db_.get(), logger_ );
        }
        if ( sqlite3_changes( db_.get() ) == 1 )
        {
            return outcome::success();
        }
        auto exists = ensureProcessingExists( calcjob_pk );
        if ( !exists )
        {
            return exists;
        }
        return DatabaseError::CONCURRENCY_VIOLATION;
    }

    outcome::result<void> SqliteMetadataStore::releaseClaim( int64_t calcjob_pk, const std::string &owner )
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement                             stmt( db_.get(),
                        "UPDATE processing SET claim_owner = NULL, claim_expires = NULL "
                        "WHERE calcjob_pk = ? AND claim_owner = ? AND state = 'playing'" );
        stmt.bind( 1, calcjob_pk ).bind( 2, owner );
        int rc = stmt.step();
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<void>( rc, db_.get(), logger_ );
        }
        return outcome::success();
    }

    outcome::result<void> SqliteMetadataStore::updateProcessing( const Processing &processing,
                                                                 const std::string &owner )
    {
        std::optional<std::string> remote_state;
        if ( processing.remote_state )
        {
            remote_state = std::string( primitives::toString( *processing.remote_state ) );
        }
        std::optional<std::string> failed_step;
        if ( processing.failed_step )
        {
            failed_step = std::string( primitives::toString( *processing.failed_step ) );
        }
        const std::string state = primitives::toString( processing.state() );

        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(),
                        "UPDATE processing SET step = ?1, state = ?2, job_id = ?3, exception = ?4, "
                        "retrieved_paths = ?5, remote_state = ?6, failed_step = ?9, "
                        "claim_owner = CASE WHEN ?2 = 'playing' THEN claim_owner ELSE NULL END, "
                        "claim_expires = CASE WHEN ?2 = 'playing' THEN claim_expires ELSE NULL END "
                        "WHERE calcjob_pk = ?7 AND claim_owner = ?8" );
        stmt.bind( 1, std::string( primitives::toString( processing.step ) ) )
            .bind( 2, state )
            .bind( 3, processing.job_id )
            .bind( 4, processing.exception )
            .bind( 5, json_columns::encodePathMap( processing.retrieved_paths ) )
            .bind( 6, remote_state )
            .bind( 7, processing.calcjob_pk )
            .bind( 8, owner )
            .bind( 9, failed_step );
        int rc = stmt.step();
        if ( rc != SQLITE_DONE )
        {
            return error_as_result<void>( rc, db_.get(), logger_ );
        }
        if ( sqlite3_changes( db_.get() ) == 1 )
        {
            return outcome::success();
        }
        auto exists = ensureProcessingExists( processing.calcjob_pk );
        if ( !exists )
        {
            return exists;
        }
        return DatabaseError::CONCURRENCY_VIOLATION;
    }

    outcome::result<std::optional<std::string>> SqliteMetadataStore::claimOwner( int64_t calcjob_pk ) const
    {
        std::lock_guard<std::recursive_mutex> lock( mutex_ );
        Statement stmt( db_.get(), "SELECT claim_owner, claim_expires FROM processing WHERE calcjob_pk = ?" );
        stmt.bind( 1, calcjob_pk );
        int rc = stmt.step();
        if ( rc == SQLITE_DONE )
        {
            return DatabaseError::NOT_FOUND;
        }
        if ( rc != SQLITE_ROW )
        {
            return error_as_result<std::optional<std::string>>( rc, db_.get(), logger_ );
        }
        auto owner = stmt.columnOptText( 0 );
        if ( owner && stmt.columnInt( 1 ) < nowMillis() )
        {
            return std::optional<std::string>{};
        }
        return owner;
    }
} // namespace calcflow::storage
