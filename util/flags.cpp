#include "util/flags.hpp"

DEFINE_string(image, "codebox-python:latest",
              "Container image used to run the submitted code");
DEFINE_string(docker_binary, "docker",
              "Docker client used to talk to the container engine");
DEFINE_string(memory_limit, "512m", "Memory ceiling of every container");
DEFINE_double(cpu_limit, 1.0, "CPU share of every container, in cores");
DEFINE_int32(pids_limit, 10, "Maximum number of processes in a container");
DEFINE_string(sandbox_user, "1000:1000",
              "Unprivileged uid:gid the submitted code runs as");

DEFINE_double(default_timeout, 30,
              "Timeout in seconds for requests that do not specify one");
DEFINE_double(max_timeout, 90, "Largest timeout in seconds a request may ask");
DEFINE_string(workspace_dir, "/tmp/codebox_workspace",
              "Where the per-request workspaces should be created");
DEFINE_string(allowed_modules,
              "pandas,numpy,openpyxl,xlsxwriter,PyPDF2,pdfplumber,python_docx,"
              "python_pptx,PIL,pytesseract,matplotlib,plotly,seaborn,"
              "reportlab,json,csv,datetime,re,os,io,sys",
              "Comma-separated list of modules the submitted code may import");
DEFINE_int32(max_concurrent_units, 0,
             "Maximum number of containers running at the same time. If "
             "unset, unbounded");
DEFINE_bool(keep_workspaces, false,
            "Do not remove workspaces after the execution, for debugging");

DEFINE_int32(
    num_cores, 0,
    "Number of requests executed in parallel. If unset, autodetect");
