#pragma once

int cmd_ingest(int argc, char** argv);
